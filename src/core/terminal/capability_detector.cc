#include <core/terminal/capability_detector.h>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string_view>
#include <system_error>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#endif

namespace depotprogress::core {

#if defined(_WIN32) || defined(_WIN64)
TerminalCapabilities PlatformCapabilityDetector::Detect() {
    HANDLE out = GetStdHandle(STD_OUTPUT_HANDLE);
    if (out == INVALID_HANDLE_VALUE || out == nullptr) {
        throw std::system_error(static_cast<int>(GetLastError()),
                                std::system_category(),
                                "GetStdHandle failed");
    }

    DWORD mode = 0;
    if (!GetConsoleMode(out, &mode)) {
        throw std::system_error(static_cast<int>(GetLastError()),
                                std::system_category(),
                                "GetConsoleMode failed");
    }

    if (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) {
        return {.supports_ansi = true, .legacy_console = false};
    }

    if (upgrade_ && SetConsoleMode(out, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
        spdlog::debug("Enabled virtual terminal processing on stdout");
        return {.supports_ansi = true, .legacy_console = false};
    }

    return {.supports_ansi = false, .legacy_console = true};
}
#else
TerminalCapabilities PlatformCapabilityDetector::Detect() {
    const char* term = std::getenv("TERM");
    if (term == nullptr) {
        return {.supports_ansi = false, .legacy_console = false};
    }

    std::string_view name(term);
    if (name.empty() || name == "dumb") {
        return {.supports_ansi = false, .legacy_console = true};
    }
    return {.supports_ansi = true, .legacy_console = false};
}
#endif

} // namespace depotprogress::core
