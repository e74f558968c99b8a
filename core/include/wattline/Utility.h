#pragma once

#include "wattline/WorkoutTypes.h"

#include <string>

namespace wattline {

std::string step_type_to_string(StepType type);

std::string match_quality_to_string(MatchQuality quality);

std::string data_quality_to_string(DataQuality quality);

}  // namespace wattline
