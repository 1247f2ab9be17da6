#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace depotprogress::core {

// Values are the state codes of the OSC 9;4 sequence.
enum class ProgressState : std::uint8_t {
    kHidden = 0,        // 隐藏进度条
    kDefault = 1,       // 正常进度
    kError = 2,         // 错误状态
    kIndeterminate = 3, // 不确定进度
    kWarning = 4,       // 警告状态
};

std::string_view ToString(ProgressState state);

std::optional<ProgressState> ParseProgressState(std::string_view name);

} // namespace depotprogress::core
