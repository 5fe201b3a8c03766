#pragma once

#include "exception.h"
#include "incidence_series.h"
#include "interval.h"
#include "math_util.h"
#include "scoped_timer.h"
#include "string_util.h"
#include "tissue_observation.h"

namespace agerisk {
/// \brief Top-level namespace for AgeRisk Core C++ API
namespace core {}
} // namespace agerisk
