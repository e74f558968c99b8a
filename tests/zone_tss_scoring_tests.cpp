#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "wattline/ComplianceScoring.h"
#include "wattline/Config.h"
#include "wattline/Errors.h"
#include "wattline/Normalization.h"
#include "wattline/TssCalculator.h"
#include "wattline/Utility.h"
#include "wattline/ZoneClassifier.h"
#include "WorkoutFixtures.h"

namespace {

bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
    using namespace wattline;

    // Zone boundaries are inclusive on the upper edge.
    {
        assert(zone_for_percent(0.0) == 1);
        assert(zone_for_percent(55.0) == 1);
        assert(zone_for_percent(55.01) == 2);
        assert(zone_for_percent(75.0) == 2);
        assert(zone_for_percent(90.0) == 3);
        assert(zone_for_percent(100.0) == 4);
        assert(zone_for_percent(105.0) == 4);
        assert(zone_for_percent(120.0) == 5);
        assert(zone_for_percent(150.0) == 6);

        assert(zone_for_power(250.0, 250.0) == 4);
        assert(zone_for_power(0.0, 250.0) == 1);
        assert(zone_for_power(400.0, 250.0) == 6);

        bool threw = false;
        try {
            (void)zone_for_power(200.0, 0.0);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);

        const auto bounds = zone_bounds_watts(200.0);
        assert(bounds[0].zone == 1 && near(bounds[0].lowWatts, 0.0) && near(*bounds[0].highWatts, 110.0));
        assert(near(bounds[3].lowWatts, 180.0) && near(*bounds[3].highWatts, 210.0));
        assert(bounds[5].zone == 6 && near(bounds[5].lowWatts, 240.0) && !bounds[5].highWatts);
    }

    // TSS: one hour at FTP is 100, aggregates round once.
    {
        assert(near(segment_tss(3600.0, 100.0, 100.0), 100.0));
        assert(near(segment_tss(3600.0, 100.0), 100.0));
        assert(near(workout_tss({{3600.0, 70.0, std::nullopt}}), 49.0));
        assert(near(workout_tss({{1800.0, 60.0, 80.0}}), 24.5));
        assert(workout_tss({}) == 0.0);
        assert(weekly_tss({}) == 0.0);

        // 3 x 0.04 unrounded sums to 0.1 only when rounding happens at the end.
        const std::vector<TssSegment> tiny{{4.0, 60.0, std::nullopt}, {4.0, 60.0, std::nullopt}, {4.0, 60.0, std::nullopt}};
        assert(near(workout_tss(tiny), 0.1));
        assert(near(weekly_tss({{{3600.0, 100.0, std::nullopt}}, {{3600.0, 70.0, std::nullopt}}}), 149.0));

        assert(near(plan_tss(fixtures::threshold_plan()), 58.8));

        const auto blocks = std::vector<PlannedStep>{
            fixtures::repeat(2, fixtures::step(StepType::Interval, 1800, 100.0, 100.0, "on"),
                             fixtures::step(StepType::Recovery, 1800, 50.0, 50.0, "off"))};
        assert(near(plan_tss(blocks), 125.0));
    }

    // Component scores.
    {
        assert(power_compliance(200.0, 190.0, 210.0) == 100.0);
        assert(power_compliance(190.0, 190.0, 210.0) == 100.0);
        assert(near(power_compliance(180.0, 190.0, 210.0), 50.0));
        assert(power_compliance(100.0, 190.0, 210.0) == 0.0);
        // Degenerate band falls back to 5% of the target as reference width.
        assert(near(power_compliance(205.0, 200.0, 200.0), 50.0));

        assert(zone_compliance(3, 3) == 100.0);
        assert(zone_compliance(4, 3) == 60.0);
        assert(zone_compliance(1, 3) == 25.0);
        assert(zone_compliance(6, 3) == 0.0);

        assert(duration_compliance(300.0, 300.0) == 100.0);
        assert(near(duration_compliance(225.0, 300.0), 75.0));
        assert(near(duration_compliance(360.0, 300.0), 80.0));
        assert(duration_compliance(700.0, 300.0) == 0.0);
        assert(duration_compliance(10.0, 0.0) == 0.0);

        const ScoringConfig weights;
        assert(near(overall_segment_score(100.0, 100.0, 100.0, weights), 100.0));
        assert(near(overall_segment_score(20.0, 100.0, 75.0, weights), 55.0, 1e-9));
    }

    // Quality bands and grades.
    {
        assert(match_quality_for(95.0) == MatchQuality::Excellent);
        assert(match_quality_for(90.0) == MatchQuality::Excellent);
        assert(match_quality_for(89.99) == MatchQuality::Good);
        assert(match_quality_for(75.0) == MatchQuality::Good);
        assert(match_quality_for(60.0) == MatchQuality::Fair);
        assert(match_quality_for(59.9) == MatchQuality::Poor);

        assert(grade_for(90.0) == "A");
        assert(grade_for(89.9) == "B");
        assert(grade_for(80.0) == "B");
        assert(grade_for(70.0) == "C");
        assert(grade_for(60.0) == "D");
        assert(grade_for(59.9) == "F");
        assert(grade_for(0.0) == "F");
    }

    // Assessment and summary text.
    {
        SegmentAnalysis seg;
        seg.matchQuality = MatchQuality::Skipped;
        assert(segment_assessment(seg) == "Segment was skipped or not detected");

        seg.matchQuality = MatchQuality::Excellent;
        seg.targetLowWatts = 238.0;
        seg.targetHighWatts = 263.0;
        seg.plannedZone = 4;
        seg.plannedDurationSec = 480.0;
        seg.actualDurationSec = 480.0;
        seg.actualAvgPower = 250.0;
        seg.actualZone = 4;
        assert(segment_assessment(seg) == "Segment executed as planned. Great work!");

        seg.actualAvgPower = 200.0;
        seg.actualZone = 3;
        seg.actualDurationSec = 360.0;
        assert(segment_assessment(seg) ==
               "Power was 38W below target. Dominant zone Z3 vs planned Z4. Segment was 25% shorter than planned.");

        assert(overall_summary(0.0, 0, 5) == "Workout not completed");
        assert(overall_summary(95.0, 4, 0) == "Outstanding execution! You nailed this workout.");
        assert(overall_summary(85.0, 3, 1) == "Good job! Minor deviations from the plan. 1 segment was skipped.");
        assert(overall_summary(40.0, 2, 2).find("2 segments were skipped.") != std::string::npos);
    }

    // Enum strings.
    {
        assert(step_type_to_string(StepType::Cooldown) == "cooldown");
        assert(step_type_to_string(StepType::Interval) == "interval");
        assert(match_quality_to_string(MatchQuality::Fair) == "fair");
        assert(match_quality_to_string(MatchQuality::Skipped) == "skipped");
        assert(data_quality_to_string(DataQuality::Partial) == "partial");
    }

    // Statistics helpers.
    {
        assert(near(mean({1.0, 2.0, 3.0, 6.0}), 3.0));
        assert(near(quantile({1.0, 2.0, 3.0, 4.0, 5.0}, 0.5), 3.0));
        assert(near(quantile({0.0, 10.0}, 0.9), 9.0));
        assert(near(round_to(58.76516, 1), 58.8));
        assert(near(round_to(-2.25, 1), -2.3));

        const auto blocks = block_average({1.0, 3.0, 5.0, 7.0, 9.0}, 2);
        assert(blocks.size() == 3 && near(blocks[0], 2.0) && near(blocks[1], 6.0) && near(blocks[2], 9.0));
    }

    // Configuration validation.
    {
        AnalyzerConfig::defaults().validate_or_throw();
        assert(DtwConfig{}.summary() == "downsample=1;window=90;penalty=0.05;psi=10;anchor=1");

        auto expect_invalid = [](const AnalyzerConfig& cfg) {
            bool threw = false;
            try {
                cfg.validate_or_throw();
            } catch (const InvalidInputError&) {
                threw = true;
            }
            assert(threw);
        };

        AnalyzerConfig weights = AnalyzerConfig::defaults();
        weights.scoring.weightPower = 0.6;
        expect_invalid(weights);

        AnalyzerConfig downsample = AnalyzerConfig::defaults();
        downsample.dtw.downsample = 0;
        expect_invalid(downsample);

        AnalyzerConfig penalty = AnalyzerConfig::defaults();
        penalty.dtw.penalty = -1.0;
        expect_invalid(penalty);

        AnalyzerConfig ratio = AnalyzerConfig::defaults();
        ratio.anchor.highRatio = 0.0;
        expect_invalid(ratio);
    }

    std::cout << "zone_tss_scoring_tests passed\n";
    return 0;
}
