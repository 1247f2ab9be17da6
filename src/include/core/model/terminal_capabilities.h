#pragma once

namespace depotprogress::core {

struct TerminalCapabilities {
    bool supports_ansi = false;
    bool legacy_console = false; // 能输出文本但不解析转义序列
};

} // namespace depotprogress::core
