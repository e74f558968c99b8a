#pragma once

#include "wattline/WorkoutTypes.h"

#include <sqlite3.h>

#include <optional>
#include <string>

namespace wattline {

// Stored alignment plus the keys it was computed under.
struct StoredAlignment {
    std::string algorithmVersion;
    std::string configSummary;
    std::string planFingerprint;
    AlignedSeries aligned;
};

/**
 * ComplianceStore: SQLite persistence for compliance reports and reusable
 * alignments, keyed by (workout_id, activity_id). Owns one connection; not
 * shared across threads. All failures throw StorageError.
 */
class ComplianceStore {
  public:
    explicit ComplianceStore(const std::string& path);
    ~ComplianceStore();

    ComplianceStore(const ComplianceStore&) = delete;
    ComplianceStore& operator=(const ComplianceStore&) = delete;

    void initialize();

    // Upsert the analysis row and replace its segment rows.
    void save_report(const std::string& workoutId, const std::string& activityId, const ComplianceReport& report);

    std::optional<std::string> load_report_json(const std::string& workoutId, const std::string& activityId) const;

    void save_alignment(const std::string& workoutId, const std::string& activityId, const StoredAlignment& stored);

    std::optional<StoredAlignment> load_alignment(const std::string& workoutId, const std::string& activityId) const;

  private:
    sqlite3* db_{nullptr};
};

}  // namespace wattline
