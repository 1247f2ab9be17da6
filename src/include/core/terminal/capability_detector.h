#pragma once

#include <core/model/terminal_capabilities.h>

namespace depotprogress::core {

class TerminalCapabilityDetector {
public:
    virtual ~TerminalCapabilityDetector() = default;

    // May throw; callers treat any exception as "no escape sequence support".
    virtual TerminalCapabilities Detect() = 0;
};

// Windows: checks the stdout console mode and tries to switch on virtual
// terminal processing. Elsewhere: trusts $TERM unless it is empty or "dumb".
class PlatformCapabilityDetector : public TerminalCapabilityDetector {
public:
    explicit PlatformCapabilityDetector(bool upgrade = true)
        : upgrade_(upgrade) {}

    TerminalCapabilities Detect() override;

private:
    bool upgrade_;
};

} // namespace depotprogress::core
