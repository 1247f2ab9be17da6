#pragma once

#include <core/model/progress_state.h>
#include <cstdint>
#include <string>

namespace depotprogress::core {

// ESC ] 9 ; 4 ; <state> ; <percent> BEL
std::string BuildProgressSequence(ProgressState state, std::uint8_t percent);

} // namespace depotprogress::core
