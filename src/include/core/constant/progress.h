#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace depotprogress::core {

namespace progress {

inline constexpr std::string_view kProgressFileEnv = "DEPOTDOWNLOADER_PROGRESS_FILE";

// https://learn.microsoft.com/en-us/windows/terminal/tutorials/progress-bar-sequences
inline constexpr char kEsc = '\x1B';
inline constexpr char kBel = '\x07';

constexpr std::uint8_t kMaxPercentage = 255;

constexpr std::chrono::milliseconds kDefaultPollInterval{100};

} // namespace progress

} // namespace depotprogress::core
