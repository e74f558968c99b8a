#include "wattline/AnchorDetector.h"
#include "wattline/Normalization.h"

namespace wattline {

std::optional<std::size_t> find_sustained_anchor(const std::vector<double>& power, const AnchorConfig& config) {
    if (power.size() < config.minRun) return std::nullopt;

    const double threshold = config.highRatio * quantile(power, config.percentile);
    // An all-zero ride has no effort to anchor on.
    if (!(threshold > 0.0)) return std::nullopt;

    std::size_t run = 0;
    for (std::size_t i = 0; i < power.size(); ++i) {
        if (power[i] >= threshold) {
            ++run;
            if (run == config.minRun) {
                const std::size_t start = i + 1 - config.minRun;
                // Later runs start later still.
                if (start > config.searchWindow) return std::nullopt;
                return start;
            }
        } else {
            run = 0;
            if (i >= config.searchWindow) return std::nullopt;
        }
    }
    return std::nullopt;
}

AnchorPair find_interval_anchors(const std::vector<double>& plannedPower,
                                 const std::vector<double>& actualPower,
                                 const AnchorConfig& config) {
    AnchorPair anchors;
    anchors.planned = find_sustained_anchor(plannedPower, config);
    anchors.actual = find_sustained_anchor(actualPower, config);
    return anchors;
}

}  // namespace wattline
