#include "wattline/StepExpander.h"
#include "wattline/Errors.h"

#include <cmath>
#include <initializer_list>
#include <string>

namespace wattline {

namespace {

std::string step_label(const PlannedStep& step) {
    return step.description.empty() ? std::string("<unnamed step>") : "'" + step.description + "'";
}

void check_target(const PlannedStep& step) {
    const PowerTarget& t = step.target;
    if (!std::isfinite(t.lowPct) || !std::isfinite(t.high())) {
        throw MalformedPlanError("Step " + step_label(step) + " has a non-finite power target");
    }
    if (t.lowPct < 0.0) {
        throw MalformedPlanError("Step " + step_label(step) + " has a negative power target");
    }
    if (t.high() < t.lowPct) {
        throw MalformedPlanError("Step " + step_label(step) + " has power high below power low");
    }
}

ExpandedSegment expand_into(const PlannedStep& step, std::size_t stepIndex, double ftpWatts,
                            std::vector<double>& watts) {
    ExpandedSegment seg;
    seg.stepIndex = stepIndex;
    seg.type = step.type;
    seg.description = step.description;
    seg.begin = watts.size();

    const StepShape shape = classify_step(step);
    if (const auto* simple = std::get_if<SimpleStep>(&shape)) {
        seg.target = simple->target;
        watts.insert(watts.end(), static_cast<std::size_t>(simple->durationSec),
                     simple->target.midpoint() * ftpWatts / 100.0);
    } else {
        const auto& block = std::get<IntervalBlock>(shape);
        seg.repeatBlock = true;
        double lowAcc = 0.0;
        double highAcc = 0.0;
        for (int r = 0; r < block.repeatCount; ++r) {
            for (const PlannedStep* sub : {block.work, block.recovery}) {
                ExpandedSegment cycle = expand_into(*sub, stepIndex, ftpWatts, watts);
                const double dur = static_cast<double>(cycle.durationSec());
                lowAcc += cycle.target.lowPct * dur;
                highAcc += cycle.target.high() * dur;
                seg.cycles.push_back(std::move(cycle));
            }
        }
        const double total = static_cast<double>(watts.size() - seg.begin);
        seg.target.lowPct = lowAcc / total;
        seg.target.highPct = highAcc / total;
    }

    seg.end = watts.size();
    return seg;
}

void flatten_into(const PlannedStep& step, std::vector<PlannedStep>& out) {
    const StepShape shape = classify_step(step);
    if (std::holds_alternative<SimpleStep>(shape)) {
        PlannedStep leaf = step;
        leaf.repeatCount.reset();
        out.push_back(std::move(leaf));
        return;
    }
    const auto& block = std::get<IntervalBlock>(shape);
    for (int r = 0; r < block.repeatCount; ++r) {
        flatten_into(*block.work, out);
        flatten_into(*block.recovery, out);
    }
}

void validate_recursive(const PlannedStep& step) {
    const StepShape shape = classify_step(step);
    if (const auto* block = std::get_if<IntervalBlock>(&shape)) {
        validate_recursive(*block->work);
        validate_recursive(*block->recovery);
    }
}

}  // namespace

StepShape classify_step(const PlannedStep& step) {
    if (step.isRepeatBlock()) {
        if (!step.repeatCount) {
            throw MalformedPlanError("Repeat block " + step_label(step) + " has no repeat count");
        }
        if (*step.repeatCount < 1) {
            throw MalformedPlanError("Repeat block " + step_label(step) + " has repeat count " +
                                     std::to_string(*step.repeatCount) + " (< 1)");
        }
        if (!step.work || !step.recovery) {
            throw MalformedPlanError("Repeat block " + step_label(step) +
                                     " must declare both a work and a recovery sub-step");
        }
        return IntervalBlock{*step.repeatCount, step.work.get(), step.recovery.get()};
    }

    if (step.durationSec <= 0) {
        throw MalformedPlanError("Step " + step_label(step) + " has non-positive duration " +
                                 std::to_string(step.durationSec));
    }
    check_target(step);
    return SimpleStep{step.durationSec, step.target};
}

void validate_plan(const std::vector<PlannedStep>& steps) {
    for (const auto& step : steps) validate_recursive(step);
}

ExpandedPlan expand_steps(const std::vector<PlannedStep>& steps, double ftpWatts) {
    if (!std::isfinite(ftpWatts) || ftpWatts <= 0.0) {
        throw InvalidInputError("FTP must be > 0, got " + std::to_string(ftpWatts));
    }
    ExpandedPlan plan;
    plan.segments.reserve(steps.size());
    for (std::size_t i = 0; i < steps.size(); ++i) {
        plan.segments.push_back(expand_into(steps[i], i, ftpWatts, plan.watts));
    }
    return plan;
}

std::vector<PlannedStep> flatten_leaf_steps(const std::vector<PlannedStep>& steps) {
    std::vector<PlannedStep> out;
    for (const auto& step : steps) flatten_into(step, out);
    return out;
}

}  // namespace wattline
