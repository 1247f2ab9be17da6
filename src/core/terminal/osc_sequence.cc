#include <core/constant/progress.h>
#include <core/terminal/osc_sequence.h>
#include <spdlog/fmt/fmt.h>

namespace depotprogress::core {

std::string BuildProgressSequence(ProgressState state, std::uint8_t percent) {
    return fmt::format("{}]9;4;{};{}{}",
                       progress::kEsc,
                       static_cast<unsigned>(state),
                       static_cast<unsigned>(percent),
                       progress::kBel);
}

} // namespace depotprogress::core
