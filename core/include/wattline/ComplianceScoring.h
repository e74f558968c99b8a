#pragma once

#include "wattline/Config.h"
#include "wattline/WorkoutTypes.h"

#include <string>

namespace wattline {

// 100 inside [lowWatts, highWatts], falling linearly with the distance outside it.
double power_compliance(double avgWatts, double lowWatts, double highWatts);

// Credit by |actualZone - plannedZone| (contract::ZONE_DISTANCE_CREDIT).
double zone_compliance(int actualZone, int plannedZone);

// 100 x (1 - |1 - actual/planned|), clamped to [0, 100].
double duration_compliance(double actualSec, double plannedSec);

// Weighted sum of the three sub-scores, clamped to [0, 100].
double overall_segment_score(double power, double zone, double duration, const ScoringConfig& weights);

MatchQuality match_quality_for(double score);

// A >= 90, B >= 80, C >= 70, D >= 60, else F.
std::string grade_for(double score);

// Human-readable deviations of one scored segment.
std::string segment_assessment(const SegmentAnalysis& segment);

std::string overall_summary(double score, int segmentsCompleted, int segmentsSkipped);

}  // namespace wattline
