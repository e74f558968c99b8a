#include <cassert>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "wattline/ComplianceAnalyzer.h"
#include "wattline/ComplianceEngine.h"
#include "wattline/ComplianceStore.h"
#include "wattline/Errors.h"
#include "wattline/Logging.h"
#include "wattline/ReportJson.h"
#include "WorkoutFixtures.h"

namespace {

std::filesystem::path fresh_db(const std::string& name) {
    const auto path = std::filesystem::temp_directory_path() / name;
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path.string() + suffix);
    }
    return path;
}

std::int64_t count_rows(const std::filesystem::path& db, const std::string& sql) {
    sqlite3* handle = nullptr;
    assert(sqlite3_open(db.string().c_str(), &handle) == SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    assert(sqlite3_prepare_v2(handle, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK);
    assert(sqlite3_step(stmt) == SQLITE_ROW);
    const std::int64_t n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    sqlite3_close(handle);
    return n;
}

}  // namespace

int main() {
    using namespace wattline;

    set_log_level(LogLevel::WARN);

    const auto plan = fixtures::threshold_plan();
    const auto ride = fixtures::threshold_ride();

    // Alignment persistence round trip.
    {
        const auto dbPath = fresh_db("wattline_store_tests.db");
        ComplianceStore store(dbPath.string());
        store.initialize();
        store.initialize();

        assert(!store.load_alignment("w1", "a1"));
        assert(!store.load_report_json("w1", "a1"));

        const ComplianceAnalyzer analyzer(250.0);
        StoredAlignment stored;
        stored.algorithmVersion = "2.0.0";
        stored.configSummary = analyzer.config().dtw.summary();
        stored.planFingerprint = "abc123";
        stored.aligned = analyzer.align(plan, ride);
        store.save_alignment("w1", "a1", stored);

        const auto loaded = store.load_alignment("w1", "a1");
        assert(loaded);
        assert(loaded->algorithmVersion == stored.algorithmVersion);
        assert(loaded->configSummary == stored.configSummary);
        assert(loaded->planFingerprint == "abc123");

        const AlignedSeries& a = loaded->aligned;
        const AlignedSeries& b = stored.aligned;
        assert(a.plannedLength == b.plannedLength);
        assert(a.stream.size() == b.stream.size());
        for (std::size_t k = 0; k < a.stream.size(); ++k) {
            assert(a.stream[k].timeOffsetSec == b.stream[k].timeOffsetSec);
            assert(a.stream[k].powerWatts == b.stream[k].powerWatts);
        }
        assert(a.mapping.ranges.size() == b.mapping.ranges.size());
        for (std::size_t k = 0; k < a.mapping.ranges.size(); ++k) {
            assert(a.mapping.ranges[k].has_value() == b.mapping.ranges[k].has_value());
            if (a.mapping.ranges[k]) {
                assert(a.mapping.ranges[k]->first == b.mapping.ranges[k]->first);
                assert(a.mapping.ranges[k]->last == b.mapping.ranges[k]->last);
            }
        }
        assert(a.mapping.path.size() == b.mapping.path.size());
        assert(a.diagnostics.anchors.planned == b.diagnostics.anchors.planned);
        assert(a.diagnostics.anchors.actual == b.diagnostics.anchors.actual);
        assert(a.diagnostics.offset == b.diagnostics.offset);
        assert(a.diagnostics.pathCost == b.diagnostics.pathCost);

        // Rescoring from the stored alignment gives the same report.
        assert(report_to_json(analyzer.analyze_with_aligned_series(plan, a)) ==
               report_to_json(analyzer.analyze_with_aligned_series(plan, b)));

        // Upsert keeps one row per pair.
        stored.planFingerprint = "def456";
        store.save_alignment("w1", "a1", stored);
        assert(store.load_alignment("w1", "a1")->planFingerprint == "def456");
        assert(count_rows(dbPath, "SELECT COUNT(*) FROM alignments;") == 1);

        // Reports replace their segment rows.
        const auto report = analyzer.analyze_with_aligned_series(plan, b);
        store.save_report("w1", "a1", report);
        store.save_report("w1", "a1", report);
        assert(*store.load_report_json("w1", "a1") == report_to_json(report));
        assert(count_rows(dbPath, "SELECT COUNT(*) FROM compliance_analyses;") == 1);
        assert(count_rows(dbPath, "SELECT COUNT(*) FROM compliance_segments;") == 7);
        assert(count_rows(dbPath, "SELECT COUNT(*) FROM compliance_segments WHERE match_quality='poor';") == 1);
    }

    // Engine: alignment reuse and invalidation.
    {
        const auto dbPath = fresh_db("wattline_engine_tests.db");
        ComplianceEngine engine(dbPath.string());

        ComplianceRequest request;
        request.workoutId = "plan-42";
        request.activityId = "ride-7";
        request.ftpWatts = 250.0;
        request.steps = plan;
        request.stream = ride;

        const auto first = engine.analyze_and_store(request);
        assert(!first.alignmentReused);
        assert(first.report.overall.grade == "B");

        const auto second = engine.analyze_and_store(request);
        assert(second.alignmentReused);
        assert(report_to_json(second.report) == report_to_json(first.report));
        assert(*engine.store().load_report_json("plan-42", "ride-7") == report_to_json(second.report));

        // Rescoring at a new FTP changes the plan in watts.
        request.ftpWatts = 260.0;
        const auto newFtp = engine.analyze_and_store(request);
        assert(!newFtp.alignmentReused);
        assert(newFtp.report.metadata.ftpWatts == 260.0);
        request.ftpWatts = 250.0;

        // A corrected ride is realigned.
        request.stream[100].powerWatts = 151.0;
        assert(!engine.analyze_and_store(request).alignmentReused);
        assert(engine.analyze_and_store(request).alignmentReused);

        // So is a different DTW configuration.
        AnalyzerConfig tuned = AnalyzerConfig::defaults();
        tuned.dtw.penalty = 0.1;
        ComplianceEngine tunedEngine(dbPath.string(), tuned);
        assert(!tunedEngine.analyze_and_store(request).alignmentReused);
        assert(count_rows(dbPath, "SELECT COUNT(*) FROM alignments;") == 1);

        // Bad requests fail before anything is written.
        ComplianceRequest missingId = request;
        missingId.activityId.clear();
        bool threw = false;
        try {
            (void)engine.analyze_and_store(missingId);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);

        ComplianceRequest noSteps = request;
        noSteps.activityId = "ride-8";
        noSteps.steps.clear();
        threw = false;
        try {
            (void)engine.analyze_and_store(noSteps);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
        assert(!engine.store().load_report_json("plan-42", "ride-8"));
    }

    // Unopenable database.
    {
        bool threw = false;
        try {
            ComplianceStore store("/nonexistent-wattline-dir/sub/compliance.db");
            store.initialize();
        } catch (const StorageError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "compliance_store_tests passed\n";
    return 0;
}
