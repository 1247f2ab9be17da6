#pragma once

#include <core/model.h>
#include <core/progress/progress_reporter.h>
#include <cstdint>

namespace depotprogress::core {

namespace progress {

// Options for the process reporter. Only effective before its first use.
void Configure(const ReporterOptions& options);

ProgressReporter& ProcessReporter();

void Initialize() noexcept;
void Report(std::uint64_t downloaded, std::uint64_t total) noexcept;
void Report(ProgressState state,
            std::uint8_t percent = 0,
            std::uint64_t downloaded = 0,
            std::uint64_t total = 0) noexcept;

} // namespace progress

} // namespace depotprogress::core
