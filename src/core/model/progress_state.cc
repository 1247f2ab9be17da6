#include <algorithm>
#include <cctype>
#include <core/model/progress_state.h>
#include <string>

namespace depotprogress::core {

std::string_view ToString(ProgressState state) {
    switch (state) {
    case ProgressState::kHidden:
        return "hidden";
    case ProgressState::kDefault:
        return "default";
    case ProgressState::kError:
        return "error";
    case ProgressState::kIndeterminate:
        return "indeterminate";
    case ProgressState::kWarning:
        return "warning";
    default:
        return "unknown";
    }
}

std::optional<ProgressState> ParseProgressState(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "hidden" || lowered == "0") {
        return ProgressState::kHidden;
    } else if (lowered == "default" || lowered == "1") {
        return ProgressState::kDefault;
    } else if (lowered == "error" || lowered == "2") {
        return ProgressState::kError;
    } else if (lowered == "indeterminate" || lowered == "3") {
        return ProgressState::kIndeterminate;
    } else if (lowered == "warning" || lowered == "4") {
        return ProgressState::kWarning;
    }
    return std::nullopt;
}

} // namespace depotprogress::core
