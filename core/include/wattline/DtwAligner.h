#pragma once

#include "wattline/Config.h"
#include "wattline/WorkoutTypes.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace wattline {

struct DtwResult {
    AlignmentMapping mapping;   // original (not downsampled) indices
    double pathCost{0.0};
    long offset{0};             // band offset actually used, original samples
    bool anchored{false};       // false when anchors were absent, disabled or rejected
    std::size_t plannedSamples{0};  // after downsampling
    std::size_t actualSamples{0};
    std::size_t bandCells{0};       // size of the banded move table
};

/**
 * DtwAligner: banded, anchor-biased dynamic time warping.
 *
 * Row i is a planned sample, column j an actual sample. Cells satisfy
 * |i - j - offset| <= window. Cell cost is
 *
 *   |planned[i] - actual[j]| + penalty * |i - j - offset| + min(up, left, diag)
 *
 * The path starts within psi of the band's first row or column and ends on
 * the band's last row or the last actual column, whichever it reaches first.
 * Planned samples past the end of a short ride get no range.
 *
 * Only two cost rows are kept; moves are stored for the band only, so memory
 * is O(planned x window) whatever the ride length.
 */
class DtwAligner {
  public:
    explicit DtwAligner(DtwConfig config);

    const DtwConfig& config() const { return config_; }

    /**
     * Align actual onto planned. Anchors are original sample indices; the
     * band is recentered on planned_anchor - actual_anchor when both are
     * present and anchoring is enabled.
     * Throws InsufficientDataError when either side has < 2 samples after
     * downsampling.
     */
    DtwResult align_with_anchors(const std::vector<double>& planned,
                                 const std::vector<double>& actual,
                                 std::optional<std::size_t> plannedAnchor,
                                 std::optional<std::size_t> actualAnchor) const;

  private:
    DtwConfig config_;
};

}  // namespace wattline
