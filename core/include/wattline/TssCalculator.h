#pragma once

#include "wattline/WorkoutTypes.h"

#include <optional>
#include <vector>

namespace wattline {

/**
 * Training Stress Score.
 *
 *   IF  = average(low, high) / 100
 *   TSS = (duration_seconds / 3600) x IF^2 x 100
 *
 * Aggregates sum unrounded segment values and round once to one decimal.
 */
struct TssSegment {
    double durationSec{0.0};
    double lowPct{0.0};
    std::optional<double> highPct;
};

double segment_tss(double durationSec, double lowPct, std::optional<double> highPct = std::nullopt);

double workout_tss(const std::vector<TssSegment>& segments);

double weekly_tss(const std::vector<std::vector<TssSegment>>& workouts);

// workout_tss over the repeat-expanded leaf steps of a plan.
double plan_tss(const std::vector<PlannedStep>& steps);

}  // namespace wattline
