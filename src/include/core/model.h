#pragma once

#include "model/progress_snapshot.h"
#include "model/progress_state.h"
#include "model/reporter_config.h"
#include "model/terminal_capabilities.h"
