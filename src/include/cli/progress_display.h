#pragma once

#include <core/model/progress_snapshot.h>
#include <string>

namespace depotprogress::cli {

// Line format used by `watch`.
class ProgressDisplay {
public:
    static std::string FormatLine(const core::ProgressSnapshot& snapshot);

    void UpdateProgress(const core::ProgressSnapshot& snapshot);
    void Complete();
};

} // namespace depotprogress::cli
