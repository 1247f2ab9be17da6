#pragma once

#include "argument_parser.h"
#include "progress_display.h"
#include "terminal.h"
#include <atomic>
#include <core/progress/progress_reporter.h>
#include <core/util/config.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace depotprogress::cli {

class CliManager {
public:
    CliManager(core::ProgressReporter& reporter, core::Settings settings);

    ~CliManager();

    // Returns the process exit code.
    int Execute(const CliOptions& options);

    void RequestStop() { stop_requested_.store(true); }

private:
    core::ProgressReporter& reporter_;
    core::Settings settings_;
    std::unique_ptr<Terminal> terminal_;
    std::unique_ptr<ProgressDisplay> progress_display_;
    std::atomic<bool> stop_requested_{false};

    void handleReport(const std::vector<std::string>& args);
    void handleState(const std::vector<std::string>& args);
    void handleSimulate(const std::vector<std::string>& args);
    int handleWatch(const std::vector<std::string>& args);
};

std::uint64_t ParseCount(const std::string& text, const char* what);

} // namespace depotprogress::cli
