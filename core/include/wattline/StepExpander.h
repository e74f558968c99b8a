#pragma once

#include "wattline/WorkoutTypes.h"

#include <variant>
#include <vector>

namespace wattline {

// Tagged view of a PlannedStep: either a plain effort or a repeat block.
struct SimpleStep {
    int durationSec{0};
    PowerTarget target;
};

struct IntervalBlock {
    int repeatCount{1};
    const PlannedStep* work{nullptr};      // non-owning, points into the step
    const PlannedStep* recovery{nullptr};
};

using StepShape = std::variant<SimpleStep, IntervalBlock>;

/**
 * Classify and validate one step (not its sub-steps).
 * Throws MalformedPlanError on a non-positive duration, a negative or
 * inverted power target, repeatCount < 1, or a repeat block missing its
 * count, work or recovery sub-step.
 */
StepShape classify_step(const PlannedStep& step);

// Recursively validate a whole plan without expanding it.
void validate_plan(const std::vector<PlannedStep>& steps);

/**
 * Flatten a plan to one target (watts) per second, in document order.
 * Each repeat emits work seconds then recovery seconds. Also records the
 * expanded range of every top-level step and every repeat cycle.
 */
ExpandedPlan expand_steps(const std::vector<PlannedStep>& steps, double ftpWatts);

// Repeat-expanded leaf steps, in document order.
std::vector<PlannedStep> flatten_leaf_steps(const std::vector<PlannedStep>& steps);

}  // namespace wattline
