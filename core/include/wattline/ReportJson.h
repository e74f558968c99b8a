#pragma once

#include "wattline/WorkoutTypes.h"

#include <string>

namespace wattline {

/**
 * Deterministic JSON export of a ComplianceReport.
 *
 * Field names are the downstream contract (segment_index, match_quality,
 * scores.power_compliance, time_in_zone.z1..z6, overall.score, ...). Absent
 * actual values serialize as null. Key order is fixed so stored reports diff
 * cleanly.
 */
std::string report_to_json(const ComplianceReport& report, int indentSpaces = 2);

}  // namespace wattline
