#include "wattline/ComplianceScoring.h"
#include "wattline/CoreContract.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace wattline {

namespace {

// Outside this relative duration error the assessment mentions it.
constexpr double kDurationNoteThreshold = 0.05;

std::string join_sentences(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ". ";
        out += parts[i];
    }
    return out + ".";
}

}  // namespace

double power_compliance(double avgWatts, double lowWatts, double highWatts) {
    if (avgWatts >= lowWatts && avgWatts <= highWatts) return 100.0;

    const double deviation = (avgWatts < lowWatts) ? (lowWatts - avgWatts) : (avgWatts - highWatts);
    const double midpoint = 0.5 * (lowWatts + highWatts);
    const double refWidth = std::max({highWatts - lowWatts, contract::MIN_BAND_FRACTION * midpoint, 1.0});
    return std::max(0.0, 100.0 * (1.0 - deviation / refWidth));
}

double zone_compliance(int actualZone, int plannedZone) {
    const std::size_t distance = static_cast<std::size_t>(std::abs(actualZone - plannedZone));
    if (distance >= contract::ZONE_DISTANCE_CREDIT.size()) return 0.0;
    return contract::ZONE_DISTANCE_CREDIT[distance];
}

double duration_compliance(double actualSec, double plannedSec) {
    if (plannedSec <= 0.0) return 0.0;
    const double ratio = actualSec / plannedSec;
    return std::clamp(100.0 * (1.0 - std::abs(1.0 - ratio)), 0.0, 100.0);
}

double overall_segment_score(double power, double zone, double duration, const ScoringConfig& weights) {
    const double score = weights.weightPower * power + weights.weightZone * zone + weights.weightDuration * duration;
    return std::clamp(score, 0.0, 100.0);
}

MatchQuality match_quality_for(double score) {
    if (score >= contract::QUALITY_EXCELLENT) return MatchQuality::Excellent;
    if (score >= contract::QUALITY_GOOD) return MatchQuality::Good;
    if (score >= contract::QUALITY_FAIR) return MatchQuality::Fair;
    return MatchQuality::Poor;
}

std::string grade_for(double score) {
    if (score >= contract::GRADE_A) return "A";
    if (score >= contract::GRADE_B) return "B";
    if (score >= contract::GRADE_C) return "C";
    if (score >= contract::GRADE_D) return "D";
    return "F";
}

std::string segment_assessment(const SegmentAnalysis& segment) {
    if (segment.matchQuality == MatchQuality::Skipped || !segment.actualAvgPower) {
        return "Segment was skipped or not detected";
    }

    std::vector<std::string> notes;
    const double avg = *segment.actualAvgPower;
    if (avg < segment.targetLowWatts) {
        notes.push_back("Power was " + std::to_string(std::lround(segment.targetLowWatts - avg)) + "W below target");
    } else if (avg > segment.targetHighWatts) {
        notes.push_back("Power was " + std::to_string(std::lround(avg - segment.targetHighWatts)) + "W above target");
    }

    if (segment.actualZone && *segment.actualZone != segment.plannedZone) {
        notes.push_back("Dominant zone Z" + std::to_string(*segment.actualZone) + " vs planned Z" +
                        std::to_string(segment.plannedZone));
    }

    if (segment.plannedDurationSec > 0.0) {
        const double ratio = segment.actualDurationSec / segment.plannedDurationSec;
        if (std::abs(1.0 - ratio) > kDurationNoteThreshold) {
            const long pct = std::lround(std::abs(1.0 - ratio) * 100.0);
            notes.push_back("Segment was " + std::to_string(pct) + "% " + (ratio < 1.0 ? "shorter" : "longer") +
                            " than planned");
        }
    }

    if (notes.empty()) return "Segment executed as planned. Great work!";
    return join_sentences(notes);
}

std::string overall_summary(double score, int segmentsCompleted, int segmentsSkipped) {
    if (segmentsCompleted == 0) return "Workout not completed";

    std::string summary;
    if (score >= contract::GRADE_A) {
        summary = "Outstanding execution! You nailed this workout.";
    } else if (score >= contract::GRADE_B) {
        summary = "Good job! Minor deviations from the plan.";
    } else if (score >= contract::GRADE_C) {
        summary = "Decent effort with some room for improvement.";
    } else if (score >= contract::GRADE_D) {
        summary = "Workout completed but with significant deviations.";
    } else {
        summary = "Workout was not completed as prescribed.";
    }

    if (segmentsSkipped > 0) {
        summary += " " + std::to_string(segmentsSkipped) +
                   (segmentsSkipped > 1 ? " segments were skipped." : " segment was skipped.");
    }
    return summary;
}

}  // namespace wattline
