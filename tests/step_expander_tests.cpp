#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "wattline/Errors.h"
#include "wattline/StepExpander.h"
#include "WorkoutFixtures.h"

namespace {

using namespace wattline;

bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

void expect_malformed(const std::vector<PlannedStep>& steps) {
    bool threw = false;
    try {
        validate_plan(steps);
    } catch (const MalformedPlanError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)expand_steps(steps, 250.0);
    } catch (const MalformedPlanError&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    using fixtures::repeat;
    using fixtures::step;

    // Simple steps: one target per second at the band midpoint.
    {
        const auto plan = expand_steps(fixtures::threshold_plan(), 250.0);
        assert(plan.watts.size() == 3240);
        assert(plan.segments.size() == 7);
        assert(near(plan.watts[0], 152.5));
        assert(near(plan.watts[600], 250.5));
        assert(near(plan.watts[3239], 152.5));

        const auto& r2 = plan.segments[4];
        assert(r2.type == StepType::Recovery);
        assert(r2.begin == 1860 && r2.end == 2160);
        assert(r2.durationSec() == 300);
        assert(r2.description == "Recovery 2");
        assert(!r2.repeatBlock && r2.cycles.empty());
    }

    // Repeat block: work then recovery, repeated in order.
    {
        const std::vector<PlannedStep> steps{
            step(StepType::Warmup, 120, 60.0, 60.0, "Warmup"),
            repeat(3, step(StepType::Interval, 60, 100.0, 110.0, "On"), step(StepType::Recovery, 30, 50.0, 50.0, "Off"),
                   "3 x 1 min"),
        };
        const auto plan = expand_steps(steps, 200.0);
        assert(plan.watts.size() == 120 + 3 * 90);
        assert(plan.segments.size() == 2);

        const auto& block = plan.segments[1];
        assert(block.repeatBlock);
        assert(block.stepIndex == 1);
        assert(block.begin == 120 && block.end == 390);
        assert(block.cycles.size() == 6);
        for (std::size_t c = 0; c < block.cycles.size(); ++c) {
            const auto& cycle = block.cycles[c];
            const bool work = (c % 2 == 0);
            assert(cycle.type == (work ? StepType::Interval : StepType::Recovery));
            assert(cycle.begin == 120 + (c / 2) * 90 + (work ? 0 : 60));
            assert(cycle.durationSec() == (work ? 60u : 30u));
        }
        assert(near(plan.watts[120], 210.0));
        assert(near(plan.watts[179], 210.0));
        assert(near(plan.watts[180], 100.0));
        assert(near(plan.watts[389], 100.0));

        // Block target is the duration-weighted band of its cycles.
        assert(near(block.target.lowPct, (60.0 * 100.0 + 30.0 * 50.0) / 90.0));
        assert(near(block.target.high(), (60.0 * 110.0 + 30.0 * 50.0) / 90.0));
    }

    // Nested blocks and the ignored block-level duration.
    {
        PlannedStep inner = repeat(2, step(StepType::Interval, 10, 120.0, 120.0, "Sprint"),
                                   step(StepType::Recovery, 5, 40.0, 40.0, "Float"));
        PlannedStep outer = repeat(2, inner, step(StepType::Recovery, 20, 50.0, 50.0, "Reset"));
        outer.durationSec = 9999;
        const auto plan = expand_steps({outer}, 300.0);
        assert(plan.watts.size() == 2 * (2 * 15 + 20));
        assert(plan.segments[0].cycles.size() == 4);
        assert(plan.segments[0].cycles[0].cycles.size() == 4);
        assert(near(plan.watts[0], 360.0));
        assert(near(plan.watts[10], 120.0));

        const auto leaves = flatten_leaf_steps({outer});
        assert(leaves.size() == 2 * (2 * 2 + 1));
        assert(leaves[0].description == "Sprint");
        assert(leaves[4].description == "Reset");
        assert(!leaves[0].repeatCount);
    }

    // Malformed plans.
    {
        PlannedStep zeroCount = repeat(1, step(StepType::Interval, 60, 100.0, 100.0, "On"),
                                       step(StepType::Recovery, 60, 50.0, 50.0, "Off"));
        zeroCount.repeatCount = 0;
        expect_malformed({zeroCount});

        PlannedStep noRecovery = zeroCount;
        noRecovery.repeatCount = 3;
        noRecovery.recovery.reset();
        expect_malformed({noRecovery});

        PlannedStep noCount = zeroCount;
        noCount.repeatCount.reset();
        expect_malformed({noCount});

        expect_malformed({step(StepType::Steady, 0, 60.0, 60.0, "empty")});
        expect_malformed({step(StepType::Steady, 60, 80.0, 70.0, "inverted")});
        expect_malformed({step(StepType::Steady, 60, -5.0, 10.0, "negative")});

        // The bad sub-step is found inside a valid-looking block.
        expect_malformed({repeat(2, step(StepType::Interval, -30, 100.0, 100.0, "On"),
                                 step(StepType::Recovery, 30, 50.0, 50.0, "Off"))});

        const std::vector<PlannedStep> good{step(StepType::Steady, 60, 80.0, 80.0, "ok")};
        validate_plan(good);
        bool threw = false;
        try {
            (void)expand_steps(good, 0.0);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "step_expander_tests passed\n";
    return 0;
}
