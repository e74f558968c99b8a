#include "wattline/Utility.h"

namespace wattline {

std::string step_type_to_string(StepType type) {
    switch (type) {
        case StepType::Warmup:
            return "warmup";
        case StepType::Interval:
            return "interval";
        case StepType::Recovery:
            return "recovery";
        case StepType::Cooldown:
            return "cooldown";
        case StepType::Steady:
            return "steady";
    }
    return "steady";
}

std::string match_quality_to_string(MatchQuality quality) {
    switch (quality) {
        case MatchQuality::Excellent:
            return "excellent";
        case MatchQuality::Good:
            return "good";
        case MatchQuality::Fair:
            return "fair";
        case MatchQuality::Poor:
            return "poor";
        case MatchQuality::Skipped:
            return "skipped";
    }
    return "skipped";
}

std::string data_quality_to_string(DataQuality quality) {
    switch (quality) {
        case DataQuality::Good:
            return "good";
        case DataQuality::Partial:
            return "partial";
        case DataQuality::Missing:
            return "missing";
    }
    return "missing";
}

}  // namespace wattline
