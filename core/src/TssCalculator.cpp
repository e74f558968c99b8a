#include "wattline/TssCalculator.h"
#include "wattline/Normalization.h"
#include "wattline/StepExpander.h"

namespace wattline {

namespace {

double raw_sum(const std::vector<TssSegment>& segments) {
    double total = 0.0;
    for (const auto& s : segments) total += segment_tss(s.durationSec, s.lowPct, s.highPct);
    return total;
}

}  // namespace

double segment_tss(double durationSec, double lowPct, std::optional<double> highPct) {
    const double intensity = 0.5 * (lowPct + highPct.value_or(lowPct)) / 100.0;
    return (durationSec / 3600.0) * intensity * intensity * 100.0;
}

double workout_tss(const std::vector<TssSegment>& segments) {
    return round_to(raw_sum(segments), 1);
}

double weekly_tss(const std::vector<std::vector<TssSegment>>& workouts) {
    double total = 0.0;
    for (const auto& w : workouts) total += raw_sum(w);
    return round_to(total, 1);
}

double plan_tss(const std::vector<PlannedStep>& steps) {
    std::vector<TssSegment> segments;
    for (const auto& leaf : flatten_leaf_steps(steps)) {
        segments.push_back({static_cast<double>(leaf.durationSec), leaf.target.lowPct, leaf.target.highPct});
    }
    return workout_tss(segments);
}

}  // namespace wattline
