#pragma once

#include "wattline/Config.h"
#include "wattline/DtwAligner.h"
#include "wattline/WorkoutTypes.h"

#include <vector>

namespace wattline {

/**
 * ComplianceAnalyzer: planned workout vs recorded ride.
 *
 * Pipeline: Expand -> Anchors -> DTW -> per-segment scoring -> aggregate.
 * Stateless apart from FTP and configuration; safe to share across threads.
 */
class ComplianceAnalyzer {
  public:
    /**
     * @param ftpWatts Functional threshold power (> 0)
     * @param config   Validated here; throws InvalidInputError when invalid
     */
    explicit ComplianceAnalyzer(double ftpWatts, AnalyzerConfig config = AnalyzerConfig::defaults());

    double ftp() const { return ftp_; }
    const AnalyzerConfig& config() const { return config_; }

    ExpandedPlan expand_steps_to_seconds(const std::vector<PlannedStep>& steps) const;

    AnchorPair find_interval_anchors(const std::vector<double>& plannedPower,
                                     const std::vector<double>& actualPower) const;

    // Validate, expand and align. The result can be stored and rescored later.
    AlignedSeries align(const std::vector<PlannedStep>& steps, const std::vector<PowerSample>& stream) const;

    std::vector<SegmentAnalysis> analyze(const std::vector<PlannedStep>& steps,
                                         const std::vector<PowerSample>& stream) const;

    ComplianceReport analyze_report(const std::vector<PlannedStep>& steps,
                                    const std::vector<PowerSample>& stream) const;

    // Score against an alignment computed earlier for the same plan durations.
    ComplianceReport analyze_with_aligned_series(const std::vector<PlannedStep>& steps,
                                                 const AlignedSeries& aligned) const;

  private:
    void validate_inputs(const std::vector<PlannedStep>& steps, const std::vector<PowerSample>& stream) const;

    SegmentAnalysis score_segment(const ExpandedSegment& segment, const AlignedSeries& aligned,
                                  std::size_t index) const;

    double ftp_;
    AnalyzerConfig config_;
    DtwAligner aligner_;
};

}  // namespace wattline
