#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include <core/constant/progress.h>
#include <core/progress/progress_reporter.h>
#include <core/terminal/osc_sequence.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace depotprogress::core {

ProgressReporter::ProgressReporter(std::shared_ptr<ConsoleHost> host,
                                   std::shared_ptr<TerminalCapabilityDetector> detector,
                                   ReporterOptions options)
    : host_(std::move(host))
    , detector_(std::move(detector))
    , options_(options)
    , writer_(options.publish_mode) {
    if (!host_) {
        host_ = std::make_shared<SystemConsoleHost>();
    }
}

void ProgressReporter::Initialize() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        resolveProgressFile();
    } catch (const std::exception& e) {
        spdlog::debug("Progress file lookup failed: {}", e.what());
        config_.progress_file_path.reset();
    }

    try {
        config_.terminal_progress_enabled = detectTerminalProgress();
    } catch (const std::exception& e) {
        spdlog::debug("Terminal capability detection failed: {}", e.what());
        config_.terminal_progress_enabled = false;
    }

    spdlog::debug("Progress reporter initialized: terminal={}, file={}",
                  config_.terminal_progress_enabled,
                  config_.progress_file_path ? config_.progress_file_path->string() : "<none>");
}

void ProgressReporter::resolveProgressFile() {
    auto value = host_->GetEnv(progress::kProgressFileEnv);
    if (value) {
        boost::algorithm::trim(*value);
    }
    if (!value || value->empty()) {
        config_.progress_file_path.reset();
        return;
    }

    config_.progress_file_path = std::filesystem::path(*value);
    if (config_.announced) {
        return;
    }
    config_.announced = true;

    try {
        host_->WriteOut(fmt::format("Progress file = {}\n", *value));
    } catch (const std::exception& e) {
        spdlog::debug("Failed to announce progress file: {}", e.what());
    }
}

bool ProgressReporter::detectTerminalProgress() {
    switch (options_.terminal_mode) {
    case TerminalMode::kOn:
        return true;
    case TerminalMode::kOff:
        return false;
    case TerminalMode::kAuto:
        break;
    }

    if (host_->IsInputRedirected() || host_->IsOutputRedirected()) {
        return false;
    }

    // OSC 9;4 has no effect on Linux terminals.
    if (host_->Os() == system::OsFamily::kLinux) {
        return false;
    }

    if (!detector_) {
        return host_->Os() == system::OsFamily::kWindows;
    }

    auto capabilities = detector_->Detect();
    return capabilities.supports_ansi && !capabilities.legacy_console;
}

std::uint8_t ProgressReporter::ComputePercentage(std::uint64_t downloaded, std::uint64_t total) {
    if (total == 0) {
        return 0;
    }
    const double ratio = static_cast<double>(downloaded) / static_cast<double>(total) * 100.0;
    const double rounded = std::round(ratio);
    return static_cast<std::uint8_t>(std::min(rounded, static_cast<double>(progress::kMaxPercentage)));
}

void ProgressReporter::Report(std::uint64_t downloaded, std::uint64_t total) noexcept {
    Report(ProgressState::kDefault, ComputePercentage(downloaded, total), downloaded, total);
}

void ProgressReporter::Report(ProgressState state,
                              std::uint8_t percent,
                              std::uint64_t downloaded,
                              std::uint64_t total) noexcept {
    ReporterConfig current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = config_;
    }

    if (current.terminal_progress_enabled) {
        try {
            host_->WriteOut(BuildProgressSequence(state, percent));
        } catch (const std::exception& e) {
            spdlog::debug("Failed to write progress sequence: {}", e.what());
        }
    }

    if (!current.progress_file_path) {
        return;
    }

    const ProgressSnapshot snapshot{
        .downloaded = downloaded,
        .total = total,
        .percentage = percent,
    };
    if (!writer_.Write(*current.progress_file_path, snapshot)) {
        spdlog::debug("Progress snapshot dropped ({}/{} {}%)", downloaded, total, percent);
    }
}

ReporterConfig ProgressReporter::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

} // namespace depotprogress::core
