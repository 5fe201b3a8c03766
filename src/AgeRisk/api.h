#pragma once

#include "calibrator.h"
#include "evaluation_suite.h"
#include "hazard_model.h"
#include "likelihood.h"
#include "mtrandom.h"
#include "mutation_accumulation_model.h"
#include "nelder_mead.h"
#include "random_algorithm.h"
#include "replicative_risk_model.h"

/// \brief Top-level namespace for AgeRisk C++ API
namespace agerisk {}
