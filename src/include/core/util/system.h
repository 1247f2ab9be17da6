#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace depotprogress::core {

namespace system {

enum class OsFamily {
    kWindows,
    kLinux,
    kMacOS,
    kOther,
};

OsFamily CurrentOsFamily();

} // namespace system

// Process-level facts the reporter depends on. Tests substitute a fake.
class ConsoleHost {
public:
    virtual ~ConsoleHost() = default;

    virtual bool IsInputRedirected() const = 0;
    virtual bool IsOutputRedirected() const = 0;
    virtual system::OsFamily Os() const = 0;
    virtual std::optional<std::string> GetEnv(std::string_view name) const = 0;

    // Writes to standard output and flushes. Throws std::system_error on failure.
    virtual void WriteOut(std::string_view text) = 0;
};

class SystemConsoleHost : public ConsoleHost {
public:
    bool IsInputRedirected() const override;
    bool IsOutputRedirected() const override;
    system::OsFamily Os() const override;
    std::optional<std::string> GetEnv(std::string_view name) const override;
    void WriteOut(std::string_view text) override;
};

} // namespace depotprogress::core
