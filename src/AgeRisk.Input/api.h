#pragma once

#include "configuration.h"
#include "jsonparser.h"
#include "poco.h"

/// @brief AgeRisk configuration input namespace
namespace agerisk::input {}
