#include "wattline/ComplianceEngine.h"
#include "wattline/CoreContract.h"
#include "wattline/Errors.h"
#include "wattline/Logging.h"

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace wattline {

namespace {

// FNV-1a 64 over the expanded plan; identifies the planned series an alignment was built on.
std::string plan_fingerprint(const std::vector<double>& plannedWatts) {
    std::uint64_t h = 14695981039346656037ull;
    auto update = [&h](const void* data, std::size_t n) {
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < n; ++i) {
            h ^= p[i];
            h *= 1099511628211ull;
        }
    };
    const std::uint64_t count = plannedWatts.size();
    update(&count, sizeof(count));
    for (double w : plannedWatts) {
        if (w == 0.0) w = 0.0;  // fold -0.0
        std::uint64_t bits = 0;
        std::memcpy(&bits, &w, sizeof(bits));
        update(&bits, sizeof(bits));
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << h;
    return oss.str();
}

bool same_stream(const std::vector<PowerSample>& a, const std::vector<PowerSample>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].timeOffsetSec != b[i].timeOffsetSec || a[i].powerWatts != b[i].powerWatts) return false;
    }
    return true;
}

}  // namespace

ComplianceEngine::ComplianceEngine(std::string databasePath, AnalyzerConfig config)
    : config_(std::move(config)), store_(std::make_unique<ComplianceStore>(databasePath)) {
    config_.validate_or_throw();
    store_->initialize();
}

ComplianceOutcome ComplianceEngine::analyze_and_store(const ComplianceRequest& request) {
    if (request.workoutId.empty() || request.activityId.empty()) {
        throw InvalidInputError("workoutId and activityId are required");
    }

    ComplianceAnalyzer analyzer(request.ftpWatts, config_);
    ComplianceOutcome outcome;

    // Step 1: Reuse a stored alignment for identical inputs
    std::optional<AlignedSeries> aligned;
    if (!request.steps.empty()) {
        const ExpandedPlan plan = analyzer.expand_steps_to_seconds(request.steps);
        const std::string fingerprint = plan_fingerprint(plan.watts);

        if (auto stored = store_->load_alignment(request.workoutId, request.activityId)) {
            if (stored->algorithmVersion == contract::ALGORITHM_VERSION &&
                stored->configSummary == config_.dtw.summary() && stored->planFingerprint == fingerprint &&
                stored->aligned.plannedLength == plan.watts.size() && same_stream(stored->aligned.stream, request.stream)) {
                aligned = std::move(stored->aligned);
                outcome.alignmentReused = true;
                log(LogLevel::INFO, "Reusing stored alignment for " + request.workoutId + "/" + request.activityId);
            }
        }

        // Step 2: Align and persist the alignment
        if (!aligned) {
            aligned = analyzer.align(request.steps, request.stream);
            StoredAlignment fresh;
            fresh.algorithmVersion = contract::ALGORITHM_VERSION;
            fresh.configSummary = config_.dtw.summary();
            fresh.planFingerprint = fingerprint;
            fresh.aligned = *aligned;
            store_->save_alignment(request.workoutId, request.activityId, fresh);
        }
    } else {
        // Let the analyzer report the empty plan.
        aligned = analyzer.align(request.steps, request.stream);
    }

    // Step 3: Score and store the report
    outcome.report = analyzer.analyze_with_aligned_series(request.steps, *aligned);
    store_->save_report(request.workoutId, request.activityId, outcome.report);
    return outcome;
}

}  // namespace wattline
