#pragma once

#include <core/model.h>
#include <core/progress/progress_file_writer.h>
#include <core/terminal/capability_detector.h>
#include <core/util/system.h>
#include <cstdint>
#include <memory>
#include <mutex>

namespace depotprogress::core {

/*
    Reports download progress as an OSC 9;4 sequence on stdout and, when
    DEPOTDOWNLOADER_PROGRESS_FILE is set, as a JSON snapshot file:

        {"downloaded":420,"total":1000,"percentage":42}

    Reporting is best effort. Initialize() and Report() never throw; console
    and file failures are logged at debug level and otherwise ignored.

    Typical use:
        ProgressReporter reporter(std::make_shared<SystemConsoleHost>(),
                                  std::make_shared<PlatformCapabilityDetector>());
        reporter.Initialize();
        reporter.Report(downloaded, total);               // per received chunk
        reporter.Report(ProgressState::kHidden);          // when finished
*/
class ProgressReporter {
public:
    // A null detector selects the platform default: enabled on Windows only.
    ProgressReporter(std::shared_ptr<ConsoleHost> host,
                     std::shared_ptr<TerminalCapabilityDetector> detector,
                     ReporterOptions options = {});

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Initialize() noexcept;

    void Report(std::uint64_t downloaded, std::uint64_t total) noexcept;
    void Report(ProgressState state,
                std::uint8_t percent = 0,
                std::uint64_t downloaded = 0,
                std::uint64_t total = 0) noexcept;

    [[nodiscard]] ReporterConfig config() const;
    [[nodiscard]] const ReporterOptions& options() const { return options_; }

    // round(downloaded / total * 100), 0 when total is 0, saturating at 255.
    static std::uint8_t ComputePercentage(std::uint64_t downloaded, std::uint64_t total);

private:
    void resolveProgressFile();
    bool detectTerminalProgress();

    std::shared_ptr<ConsoleHost> host_;
    std::shared_ptr<TerminalCapabilityDetector> detector_;
    ReporterOptions options_;
    ProgressFileWriter writer_;

    mutable std::mutex mutex_;
    ReporterConfig config_;
};

} // namespace depotprogress::core
