#pragma once

#include "wattline/ComplianceAnalyzer.h"
#include "wattline/ComplianceStore.h"
#include "wattline/Config.h"

#include <memory>
#include <string>
#include <vector>

namespace wattline {

struct ComplianceRequest {
    std::string workoutId;
    std::string activityId;
    double ftpWatts{0.0};
    std::vector<PlannedStep> steps;
    std::vector<PowerSample> stream;
};

struct ComplianceOutcome {
    ComplianceReport report;
    bool alignmentReused{false};
};

/**
 * ComplianceEngine: analysis pipeline with persistence
 *
 * Orchestrates: stored alignment lookup -> (align) -> score -> store
 */
class ComplianceEngine {
  public:
    explicit ComplianceEngine(std::string databasePath, AnalyzerConfig config = AnalyzerConfig::defaults());

    /**
     * Analyze one (workout, activity) pair and store the report.
     * A stored alignment is reused when it was computed by the same algorithm
     * version and DTW configuration, for the same expanded plan and stream.
     */
    ComplianceOutcome analyze_and_store(const ComplianceRequest& request);

    ComplianceStore& store() { return *store_; }

  private:
    AnalyzerConfig config_;
    std::unique_ptr<ComplianceStore> store_;
};

}  // namespace wattline
