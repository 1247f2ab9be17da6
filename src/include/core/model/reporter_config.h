#pragma once

#include <filesystem>
#include <optional>

namespace depotprogress::core {

enum class TerminalMode {
    kAuto, // 根据终端能力检测
    kOn,
    kOff,
};

enum class PublishMode {
    kTruncate,     // 直接截断重写
    kAtomicRename, // 写临时文件后重命名
};

struct ReporterOptions {
    TerminalMode terminal_mode = TerminalMode::kAuto;
    PublishMode publish_mode = PublishMode::kTruncate;
};

struct ReporterConfig {
    bool terminal_progress_enabled = false;
    std::optional<std::filesystem::path> progress_file_path;
    bool announced = false;
};

} // namespace depotprogress::core
