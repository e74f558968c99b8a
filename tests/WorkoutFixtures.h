#pragma once

#include "wattline/WorkoutTypes.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wattline::fixtures {

inline PlannedStep step(StepType type, int durationSec, double lowPct, double highPct, std::string description) {
    PlannedStep s;
    s.type = type;
    s.durationSec = durationSec;
    s.target.lowPct = lowPct;
    s.target.highPct = highPct;
    s.description = std::move(description);
    return s;
}

inline PlannedStep repeat(int count, PlannedStep work, PlannedStep recovery, std::string description = "") {
    PlannedStep s;
    s.type = StepType::Interval;
    s.description = std::move(description);
    s.repeatCount = count;
    s.work = std::make_shared<const PlannedStep>(std::move(work));
    s.recovery = std::make_shared<const PlannedStep>(std::move(recovery));
    return s;
}

// Append `seconds` samples at constant power, continuing the time axis.
inline void append_constant(std::vector<PowerSample>& stream, int seconds, double watts) {
    for (int k = 0; k < seconds; ++k) {
        PowerSample s;
        s.timeOffsetSec = static_cast<double>(stream.size());
        s.powerWatts = watts;
        stream.push_back(s);
    }
}

// 3 x 8 min threshold intervals with 5 min recoveries, 10 min warmup and cooldown.
inline std::vector<PlannedStep> threshold_plan() {
    return {
        step(StepType::Warmup, 600, 56.0, 66.0, "Warmup"),
        step(StepType::Interval, 480, 95.2, 105.2, "Threshold 1"),
        step(StepType::Recovery, 300, 56.0, 66.0, "Recovery 1"),
        step(StepType::Interval, 480, 95.2, 105.2, "Threshold 2"),
        step(StepType::Recovery, 300, 56.0, 66.0, "Recovery 2"),
        step(StepType::Interval, 480, 95.2, 105.2, "Threshold 3"),
        step(StepType::Cooldown, 600, 56.0, 66.0, "Cooldown"),
    };
}

/**
 * Ride for threshold_plan() at FTP 250: intervals on target, recoveries
 * ridden at 185 W, second recovery cut to 225 s.
 */
inline std::vector<PowerSample> threshold_ride() {
    std::vector<PowerSample> stream;
    append_constant(stream, 600, 150.0);
    append_constant(stream, 480, 252.0);
    append_constant(stream, 300, 185.0);
    append_constant(stream, 480, 252.0);
    append_constant(stream, 225, 185.0);
    append_constant(stream, 480, 252.0);
    append_constant(stream, 600, 150.0);
    return stream;
}

}  // namespace wattline::fixtures
