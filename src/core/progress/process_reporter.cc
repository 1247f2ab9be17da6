#include <core/progress/process_reporter.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

namespace depotprogress::core {

namespace progress {

namespace {

std::mutex options_mutex;
ReporterOptions pending_options;
bool reporter_created = false;

} // namespace

void Configure(const ReporterOptions& options) {
    std::lock_guard<std::mutex> lock(options_mutex);
    if (reporter_created) {
        spdlog::warn("Process reporter already created, options ignored");
        return;
    }
    pending_options = options;
}

ProgressReporter& ProcessReporter() {
    static ProgressReporter reporter = [] {
        std::lock_guard<std::mutex> lock(options_mutex);
        reporter_created = true;
        return ProgressReporter(std::make_shared<SystemConsoleHost>(),
                                std::make_shared<PlatformCapabilityDetector>(),
                                pending_options);
    }();
    return reporter;
}

void Initialize() noexcept {
    ProcessReporter().Initialize();
}

void Report(std::uint64_t downloaded, std::uint64_t total) noexcept {
    ProcessReporter().Report(downloaded, total);
}

void Report(ProgressState state,
            std::uint8_t percent,
            std::uint64_t downloaded,
            std::uint64_t total) noexcept {
    ProcessReporter().Report(state, percent, downloaded, total);
}

} // namespace progress

} // namespace depotprogress::core
