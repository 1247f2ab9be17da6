#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <core/util/system.h>
#include <string>
#include <system_error>
#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace depotprogress::core {

namespace system {

OsFamily CurrentOsFamily() {
#if defined(_WIN32) || defined(_WIN64)
    return OsFamily::kWindows;
#elif defined(__linux__)
    return OsFamily::kLinux;
#elif defined(__APPLE__) || defined(__MACH__)
    return OsFamily::kMacOS;
#else
    return OsFamily::kOther;
#endif
}

} // namespace system

#if defined(_WIN32) || defined(_WIN64)
bool SystemConsoleHost::IsInputRedirected() const {
    return _isatty(_fileno(stdin)) == 0;
}

bool SystemConsoleHost::IsOutputRedirected() const {
    return _isatty(_fileno(stdout)) == 0;
}
#else
bool SystemConsoleHost::IsInputRedirected() const {
    return isatty(STDIN_FILENO) == 0;
}

bool SystemConsoleHost::IsOutputRedirected() const {
    return isatty(STDOUT_FILENO) == 0;
}
#endif

system::OsFamily SystemConsoleHost::Os() const {
    return system::CurrentOsFamily();
}

std::optional<std::string> SystemConsoleHost::GetEnv(std::string_view name) const {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void SystemConsoleHost::WriteOut(std::string_view text) {
    if (std::fwrite(text.data(), 1, text.size(), stdout) != text.size()
        || std::fflush(stdout) != 0) {
        throw std::system_error(errno, std::generic_category(), "write to stdout failed");
    }
}

} // namespace depotprogress::core
