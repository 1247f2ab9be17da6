#include <cli/progress_display.h>
#include <iostream>
#include <spdlog/fmt/fmt.h>

namespace depotprogress::cli {

std::string ProgressDisplay::FormatLine(const core::ProgressSnapshot& snapshot) {
    const double percentage = static_cast<double>(snapshot.percentage);
    if (snapshot.total > 0) {
        return fmt::format("{:6.2f}%  ({}/{} bytes)", percentage, snapshot.downloaded, snapshot.total);
    }
    return fmt::format("{:6.2f}%  (percent-only)", percentage);
}

void ProgressDisplay::UpdateProgress(const core::ProgressSnapshot& snapshot) {
    std::cout << FormatLine(snapshot) << std::endl;
}

void ProgressDisplay::Complete() {
    std::cout << "Download complete." << std::endl;
}

} // namespace depotprogress::cli
