#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wattline {

// ========== Planned Workout (input) ==========

enum class StepType { Warmup, Interval, Recovery, Cooldown, Steady };

// Target power band in %FTP. highPct defaults to lowPct.
struct PowerTarget {
    double lowPct{0.0};
    std::optional<double> highPct;

    double high() const { return highPct.value_or(lowPct); }
    double midpoint() const { return 0.5 * (lowPct + high()); }
};

/**
 * One step of a structured workout.
 *
 * A step with repeatCount set is a repeat block: it expands to
 * repeatCount x (work, recovery) and its own durationSec/target are ignored.
 * Sub-steps may themselves be repeat blocks.
 */
struct PlannedStep {
    StepType type{StepType::Steady};
    int durationSec{0};
    PowerTarget target;
    std::string description;

    std::optional<int> repeatCount;
    std::shared_ptr<const PlannedStep> work;
    std::shared_ptr<const PlannedStep> recovery;

    bool isRepeatBlock() const { return repeatCount.has_value() || work || recovery; }
};

// ========== Recorded Ride (input) ==========

struct PowerSample {
    double timeOffsetSec{0.0};
    double powerWatts{0.0};
};

// ========== Expanded Plan ==========

/**
 * Half-open range [begin, end) of the per-second plan covered by one step.
 * For repeat blocks, cycles holds one entry per work and per recovery
 * occurrence, in document order, and target is the duration-weighted mean.
 */
struct ExpandedSegment {
    std::size_t stepIndex{0};
    std::size_t begin{0};
    std::size_t end{0};
    StepType type{StepType::Steady};
    PowerTarget target;
    std::string description;
    bool repeatBlock{false};
    std::vector<ExpandedSegment> cycles;

    std::size_t durationSec() const { return end - begin; }
};

struct ExpandedPlan {
    std::vector<double> watts;  // one target per second (midpoint x FTP / 100)
    std::vector<ExpandedSegment> segments;
};

// ========== Alignment ==========

struct IndexPair {
    std::size_t planned{0};
    std::size_t actual{0};
};

// Inclusive range of actual indices mapped onto one planned index.
struct ActualRange {
    std::size_t first{0};
    std::size_t last{0};
};

struct AlignmentMapping {
    std::vector<IndexPair> path;                     // monotonic in both coordinates
    std::vector<std::optional<ActualRange>> ranges;  // one per planned index
};

struct AnchorPair {
    std::optional<std::size_t> planned;
    std::optional<std::size_t> actual;
};

struct AlignmentDiagnostics {
    std::string algorithm;
    std::string version;
    std::string configSummary;  // downsample/window/penalty/psi/anchor
    AnchorPair anchors;         // raw detector output, original sample indices
    long offset{0};             // effective band offset, original samples
    double pathCost{0.0};
    std::size_t pathLength{0};
};

// Reusable alignment: the stream it was computed on plus the mapping.
struct AlignedSeries {
    std::vector<PowerSample> stream;
    std::size_t plannedLength{0};
    AlignmentMapping mapping;
    AlignmentDiagnostics diagnostics;
};

// ========== Compliance Report (output) ==========

enum class MatchQuality { Excellent, Good, Fair, Poor, Skipped };

enum class DataQuality { Good, Partial, Missing };

// Fraction of samples per zone, z1..z6.
using ZoneDistribution = std::array<double, 6>;

struct SegmentScores {
    double power{0.0};
    double zone{0.0};
    double duration{0.0};
    double overall{0.0};
};

struct SegmentAnalysis {
    std::size_t segmentIndex{0};
    StepType type{StepType::Steady};
    std::string description;

    // Planned
    double plannedStartSec{0.0};
    double plannedDurationSec{0.0};
    double targetLowWatts{0.0};
    double targetHighWatts{0.0};
    int plannedZone{1};

    // Actual (absent when skipped)
    std::optional<double> actualStartSec;
    std::optional<double> actualEndSec;
    double actualDurationSec{0.0};
    std::optional<double> actualAvgPower;
    std::optional<double> actualMaxPower;
    std::optional<double> actualMinPower;
    std::optional<int> actualZone;
    ZoneDistribution timeInZone{};

    SegmentScores scores;
    MatchQuality matchQuality{MatchQuality::Skipped};
    std::string assessment;

    std::vector<SegmentAnalysis> cycles;  // repeat blocks only
};

struct OverallCompliance {
    double score{0.0};
    std::string grade{"F"};
    int segmentsCompleted{0};
    int segmentsSkipped{0};
    int segmentsTotal{0};
    std::string summary;
    double plannedTss{0.0};
    double executedTss{0.0};
};

struct DetectedPause {
    double startSec{0.0};
    double endSec{0.0};
    double durationSec{0.0};
};

struct ComplianceMetadata {
    std::string algorithmVersion;
    DataQuality dataQuality{DataQuality::Missing};
    double analyzedDurationSec{0.0};
    double ftpWatts{0.0};
    AlignmentDiagnostics alignment;
    std::vector<DetectedPause> pauses;
};

struct ComplianceReport {
    std::vector<SegmentAnalysis> segments;
    OverallCompliance overall;
    ComplianceMetadata metadata;
};

}  // namespace wattline
