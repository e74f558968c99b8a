#pragma once

#include "wattline/Config.h"
#include "wattline/WorkoutTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace wattline {

/**
 * Start index of the first sustained hard effort in one power sequence.
 *
 * threshold = highRatio x (the sequence's own percentile power). Returns the
 * start of the earliest run of >= minRun consecutive samples at or above the
 * threshold whose start index is <= searchWindow, or nullopt.
 */
std::optional<std::size_t> find_sustained_anchor(const std::vector<double>& power, const AnchorConfig& config);

// Both anchors, detected independently. Either side may be null.
AnchorPair find_interval_anchors(const std::vector<double>& plannedPower,
                                 const std::vector<double>& actualPower,
                                 const AnchorConfig& config);

}  // namespace wattline
