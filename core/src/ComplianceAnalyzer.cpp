#include "wattline/ComplianceAnalyzer.h"
#include "wattline/AnchorDetector.h"
#include "wattline/ComplianceScoring.h"
#include "wattline/CoreContract.h"
#include "wattline/Errors.h"
#include "wattline/Logging.h"
#include "wattline/Normalization.h"
#include "wattline/StepExpander.h"
#include "wattline/TssCalculator.h"
#include "wattline/Utility.h"
#include "wattline/ZoneClassifier.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <string>

namespace wattline {

namespace {

constexpr double kSampleSec = 1.0 / contract::SAMPLE_RATE_HZ;

double checked_ftp(double ftpWatts) {
    if (!std::isfinite(ftpWatts) || ftpWatts <= 0.0) {
        throw InvalidInputError("FTP must be > 0, got " + std::to_string(ftpWatts));
    }
    return ftpWatts;
}

const AnalyzerConfig& checked_config(const AnalyzerConfig& config) {
    config.validate_or_throw();
    return config;
}

std::vector<double> powers_of(const std::vector<PowerSample>& stream) {
    std::vector<double> out;
    out.reserve(stream.size());
    for (const auto& s : stream) out.push_back(s.powerWatts);
    return out;
}

DataQuality assess_data_quality(const std::vector<PowerSample>& stream) {
    if (stream.empty()) return DataQuality::Missing;
    const auto nonZero = std::count_if(stream.begin(), stream.end(), [](const PowerSample& s) { return s.powerWatts > 0.0; });
    const double fraction = static_cast<double>(nonZero) / static_cast<double>(stream.size());
    return fraction < contract::DATA_QUALITY_MIN_NONZERO ? DataQuality::Partial : DataQuality::Good;
}

std::vector<DetectedPause> detect_pauses(const std::vector<PowerSample>& stream) {
    std::vector<DetectedPause> pauses;
    std::size_t runStart = 0;
    std::size_t run = 0;
    auto close_run = [&](std::size_t endExclusive) {
        if (run >= contract::PAUSE_MIN_SEC) {
            DetectedPause p;
            p.startSec = stream[runStart].timeOffsetSec;
            p.endSec = stream[endExclusive - 1].timeOffsetSec + kSampleSec;
            p.durationSec = p.endSec - p.startSec;
            pauses.push_back(p);
        }
        run = 0;
    };
    for (std::size_t i = 0; i < stream.size(); ++i) {
        if (stream[i].powerWatts < contract::PAUSE_POWER_W) {
            if (run == 0) runStart = i;
            ++run;
        } else {
            close_run(i);
        }
    }
    close_run(stream.size());
    return pauses;
}

}  // namespace

ComplianceAnalyzer::ComplianceAnalyzer(double ftpWatts, AnalyzerConfig config)
    : ftp_(checked_ftp(ftpWatts)), config_(checked_config(config)), aligner_(config_.dtw) {}

ExpandedPlan ComplianceAnalyzer::expand_steps_to_seconds(const std::vector<PlannedStep>& steps) const {
    return expand_steps(steps, ftp_);
}

AnchorPair ComplianceAnalyzer::find_interval_anchors(const std::vector<double>& plannedPower,
                                                     const std::vector<double>& actualPower) const {
    return wattline::find_interval_anchors(plannedPower, actualPower, config_.anchor);
}

void ComplianceAnalyzer::validate_inputs(const std::vector<PlannedStep>& steps,
                                         const std::vector<PowerSample>& stream) const {
    if (steps.empty()) {
        throw InvalidInputError("Planned workout has no steps");
    }
    if (stream.empty()) {
        throw InvalidInputError("Actual power stream is empty");
    }
    if (stream.size() > config_.maxStreamSamples) {
        throw StreamTooLargeError("Actual power stream has " + std::to_string(stream.size()) +
                                  " samples, limit is " + std::to_string(config_.maxStreamSamples));
    }
    for (std::size_t i = 0; i < stream.size(); ++i) {
        const PowerSample& s = stream[i];
        if (!std::isfinite(s.timeOffsetSec) || !std::isfinite(s.powerWatts) || s.timeOffsetSec < 0.0 ||
            s.powerWatts < 0.0) {
            throw InvalidInputError("Sample " + std::to_string(i) + " has a negative or non-finite value");
        }
        if (i > 0 && s.timeOffsetSec < stream[i - 1].timeOffsetSec) {
            throw InvalidInputError("Sample " + std::to_string(i) + " goes back in time");
        }
    }
    validate_plan(steps);
}

AlignedSeries ComplianceAnalyzer::align(const std::vector<PlannedStep>& steps,
                                        const std::vector<PowerSample>& stream) const {
    validate_inputs(steps, stream);

    const ExpandedPlan plan = expand_steps_to_seconds(steps);
    const std::vector<double> actual = powers_of(stream);
    const AnchorPair anchors = find_interval_anchors(plan.watts, actual);
    DtwResult dtw = aligner_.align_with_anchors(plan.watts, actual, anchors.planned, anchors.actual);

    AlignedSeries aligned;
    aligned.stream = stream;
    aligned.plannedLength = plan.watts.size();
    aligned.mapping = std::move(dtw.mapping);

    AlignmentDiagnostics& diag = aligned.diagnostics;
    diag.algorithm = contract::ALIGNER_NAME;
    diag.version = contract::ALGORITHM_VERSION;
    diag.configSummary = config_.dtw.summary();
    diag.anchors = anchors;
    diag.offset = dtw.offset;
    diag.pathCost = dtw.pathCost;
    diag.pathLength = aligned.mapping.path.size();

    std::ostringstream oss;
    oss << "Aligned " << actual.size() << " samples onto " << plan.watts.size() << " planned seconds: anchors "
        << (anchors.planned ? std::to_string(*anchors.planned) : "none") << "/"
        << (anchors.actual ? std::to_string(*anchors.actual) : "none") << ", offset " << dtw.offset
        << (dtw.anchored ? "" : " (unanchored)") << ", cost " << dtw.pathCost << ", path " << diag.pathLength;
    log(LogLevel::DEBUG, oss.str());
    return aligned;
}

std::vector<SegmentAnalysis> ComplianceAnalyzer::analyze(const std::vector<PlannedStep>& steps,
                                                         const std::vector<PowerSample>& stream) const {
    return analyze_report(steps, stream).segments;
}

ComplianceReport ComplianceAnalyzer::analyze_report(const std::vector<PlannedStep>& steps,
                                                    const std::vector<PowerSample>& stream) const {
    return analyze_with_aligned_series(steps, align(steps, stream));
}

SegmentAnalysis ComplianceAnalyzer::score_segment(const ExpandedSegment& segment, const AlignedSeries& aligned,
                                                  std::size_t index) const {
    SegmentAnalysis out;
    out.segmentIndex = index;
    out.type = segment.type;
    out.description = segment.description;
    out.plannedStartSec = static_cast<double>(segment.begin) * kSampleSec;
    out.plannedDurationSec = static_cast<double>(segment.durationSec()) * kSampleSec;
    out.targetLowWatts = segment.target.lowPct * ftp_ / 100.0;
    out.targetHighWatts = segment.target.high() * ftp_ / 100.0;
    out.plannedZone = zone_for_percent(segment.target.midpoint());

    // Union of the actual ranges of every planned second in the segment.
    std::optional<ActualRange> span;
    for (std::size_t k = segment.begin; k < segment.end; ++k) {
        const auto& r = aligned.mapping.ranges[k];
        if (!r) continue;
        if (!span) {
            span = r;
        } else {
            span->first = std::min(span->first, r->first);
            span->last = std::max(span->last, r->last);
        }
    }

    if (!span) {
        out.matchQuality = MatchQuality::Skipped;
    } else {
        const auto& stream = aligned.stream;
        const std::size_t count = span->last - span->first + 1;
        double sum = 0.0;
        double maxP = stream[span->first].powerWatts;
        double minP = maxP;
        std::array<std::size_t, 6> zoneCounts{};
        for (std::size_t k = span->first; k <= span->last; ++k) {
            const double w = stream[k].powerWatts;
            sum += w;
            maxP = std::max(maxP, w);
            minP = std::min(minP, w);
            ++zoneCounts[static_cast<std::size_t>(zone_for_power(w, ftp_) - 1)];
        }

        out.actualStartSec = stream[span->first].timeOffsetSec;
        out.actualEndSec = stream[span->last].timeOffsetSec + kSampleSec;
        out.actualDurationSec = static_cast<double>(count) * kSampleSec;
        out.actualAvgPower = sum / static_cast<double>(count);
        out.actualMaxPower = maxP;
        out.actualMinPower = minP;

        // Plurality zone; strict comparison keeps the lower zone on ties.
        std::size_t dominant = 0;
        for (std::size_t z = 0; z < zoneCounts.size(); ++z) {
            out.timeInZone[z] = static_cast<double>(zoneCounts[z]) / static_cast<double>(count);
            if (zoneCounts[z] > zoneCounts[dominant]) dominant = z;
        }
        out.actualZone = static_cast<int>(dominant) + 1;

        out.scores.power = power_compliance(*out.actualAvgPower, out.targetLowWatts, out.targetHighWatts);
        out.scores.zone = zone_compliance(*out.actualZone, out.plannedZone);
        out.scores.duration = duration_compliance(out.actualDurationSec, out.plannedDurationSec);
        out.scores.overall = overall_segment_score(out.scores.power, out.scores.zone, out.scores.duration, config_.scoring);
        out.matchQuality = match_quality_for(out.scores.overall);
    }
    out.assessment = segment_assessment(out);

    for (std::size_t c = 0; c < segment.cycles.size(); ++c) {
        out.cycles.push_back(score_segment(segment.cycles[c], aligned, c));
    }
    return out;
}

ComplianceReport ComplianceAnalyzer::analyze_with_aligned_series(const std::vector<PlannedStep>& steps,
                                                                 const AlignedSeries& aligned) const {
    if (steps.empty()) {
        throw InvalidInputError("Planned workout has no steps");
    }
    validate_plan(steps);
    const ExpandedPlan plan = expand_steps_to_seconds(steps);

    if (aligned.plannedLength != plan.watts.size() || aligned.mapping.ranges.size() != plan.watts.size()) {
        throw InvalidInputError("Aligned series covers " + std::to_string(aligned.mapping.ranges.size()) +
                                " planned seconds, plan expands to " + std::to_string(plan.watts.size()));
    }
    for (const auto& r : aligned.mapping.ranges) {
        if (r && (r->first > r->last || r->last >= aligned.stream.size())) {
            throw InvalidInputError("Aligned series references samples outside its stream");
        }
    }

    ComplianceReport report;
    report.segments.reserve(plan.segments.size());

    double scoreSum = 0.0;
    double executedTss = 0.0;
    OverallCompliance& overall = report.overall;
    for (std::size_t i = 0; i < plan.segments.size(); ++i) {
        SegmentAnalysis seg = score_segment(plan.segments[i], aligned, i);
        if (seg.matchQuality == MatchQuality::Skipped) {
            ++overall.segmentsSkipped;
            log(LogLevel::WARN, "Segment " + std::to_string(i) + " (" + step_type_to_string(seg.type) +
                                    ") has no aligned samples, marked skipped");
        } else {
            ++overall.segmentsCompleted;
            scoreSum += seg.scores.overall;
            executedTss += segment_tss(seg.actualDurationSec, *seg.actualAvgPower / ftp_ * 100.0);
        }
        report.segments.push_back(std::move(seg));
    }

    overall.segmentsTotal = static_cast<int>(report.segments.size());
    overall.score = overall.segmentsCompleted > 0
                        ? std::clamp(round_to(scoreSum / overall.segmentsCompleted, 1), 0.0, 100.0)
                        : 0.0;
    overall.grade = grade_for(overall.score);
    overall.summary = overall_summary(overall.score, overall.segmentsCompleted, overall.segmentsSkipped);
    overall.plannedTss = plan_tss(steps);
    overall.executedTss = round_to(executedTss, 1);

    ComplianceMetadata& meta = report.metadata;
    meta.algorithmVersion = contract::ALGORITHM_VERSION;
    meta.dataQuality = assess_data_quality(aligned.stream);
    meta.analyzedDurationSec =
        aligned.stream.empty() ? 0.0 : aligned.stream.back().timeOffsetSec - aligned.stream.front().timeOffsetSec + kSampleSec;
    meta.ftpWatts = ftp_;
    meta.alignment = aligned.diagnostics;
    meta.pauses = detect_pauses(aligned.stream);

    log(LogLevel::DEBUG, "Compliance " + std::to_string(overall.score) + " (" + overall.grade + "), " +
                             std::to_string(overall.segmentsCompleted) + "/" + std::to_string(overall.segmentsTotal) +
                             " segments completed");
    return report;
}

}  // namespace wattline
