#include "wattline/ComplianceStore.h"

#include "wattline/CoreContract.h"
#include "wattline/Errors.h"
#include "wattline/Logging.h"
#include "wattline/ReportJson.h"
#include "wattline/Utility.h"

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace wattline {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw StorageError(message);
    }
}

StmtPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(sqlite3_errmsg(db));
    }
    return StmtPtr(stmt, &sqlite3_finalize);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageError(sqlite3_errmsg(db));
    }
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int idx, const std::optional<double>& value) {
    if (value) {
        sqlite3_bind_double(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void bind_optional_index(sqlite3_stmt* stmt, int idx, const std::optional<std::size_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(*value));
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

template <typename T>
void bind_blob(sqlite3_stmt* stmt, int idx, const std::vector<T>& values) {
    const int size = static_cast<int>(values.size() * sizeof(T));
    if (size == 0) {
        sqlite3_bind_zeroblob(stmt, idx, 0);
    } else {
        sqlite3_bind_blob(stmt, idx, values.data(), size, SQLITE_TRANSIENT);
    }
}

template <typename T>
std::vector<T> column_blob(sqlite3_stmt* stmt, int col) {
    const int bytes = sqlite3_column_bytes(stmt, col);
    const void* data = sqlite3_column_blob(stmt, col);
    if (bytes % static_cast<int>(sizeof(T)) != 0) {
        throw StorageError("Corrupt blob in column " + std::to_string(col));
    }
    std::vector<T> out(static_cast<std::size_t>(bytes) / sizeof(T));
    if (!out.empty() && data) std::memcpy(out.data(), data, static_cast<std::size_t>(bytes));
    return out;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::size_t> column_optional_index(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<std::size_t>(sqlite3_column_int64(stmt, col));
}

constexpr std::int64_t kNoRange = -1;

}  // namespace

ComplianceStore::ComplianceStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open SQLite database at " + path + ": " + message);
    }
}

ComplianceStore::~ComplianceStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void ComplianceStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS compliance_analyses (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            workout_id TEXT NOT NULL,
            activity_id TEXT NOT NULL,
            ftp REAL NOT NULL,
            score REAL NOT NULL,
            grade TEXT NOT NULL,
            summary TEXT,
            segments_completed INTEGER NOT NULL,
            segments_skipped INTEGER NOT NULL,
            segments_total INTEGER NOT NULL,
            algorithm_version TEXT NOT NULL,
            data_quality TEXT NOT NULL,
            report_json TEXT NOT NULL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(workout_id, activity_id)
        );

        CREATE INDEX IF NOT EXISTS idx_analyses_activity ON compliance_analyses(activity_id);

        CREATE TRIGGER IF NOT EXISTS update_analyses_timestamp
            AFTER UPDATE ON compliance_analyses FOR EACH ROW
        BEGIN
            UPDATE compliance_analyses SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
        END;

        CREATE TABLE IF NOT EXISTS compliance_segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            analysis_id INTEGER NOT NULL,
            segment_index INTEGER NOT NULL,
            segment_type TEXT NOT NULL,
            match_quality TEXT NOT NULL,
            planned_duration_sec REAL NOT NULL,
            actual_duration_sec REAL,
            actual_avg_power REAL,
            power_compliance REAL NOT NULL,
            zone_compliance REAL NOT NULL,
            duration_compliance REAL NOT NULL,
            overall_segment_score REAL NOT NULL,
            assessment TEXT,
            FOREIGN KEY(analysis_id) REFERENCES compliance_analyses(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_segments_analysis ON compliance_segments(analysis_id);

        -- Reusable alignments: stream and ranges as native-endian blobs
        CREATE TABLE IF NOT EXISTS alignments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            workout_id TEXT NOT NULL,
            activity_id TEXT NOT NULL,
            algorithm_version TEXT NOT NULL,
            config_summary TEXT NOT NULL,
            plan_fingerprint TEXT NOT NULL,
            planned_length INTEGER NOT NULL,
            stream_length INTEGER NOT NULL,
            times_blob BLOB NOT NULL,   -- f64 time offsets
            power_blob BLOB NOT NULL,   -- f64 watts
            ranges_blob BLOB NOT NULL,  -- i64 (first, last) per planned second, -1 when empty
            path_blob BLOB NOT NULL,    -- i64 (planned, actual) pairs
            planned_anchor INTEGER,
            actual_anchor INTEGER,
            band_offset INTEGER NOT NULL,
            path_cost REAL NOT NULL,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(workout_id, activity_id)
        );
    )SQL";

    exec_or_throw(db_, schema);
}

void ComplianceStore::save_report(const std::string& workoutId, const std::string& activityId,
                                  const ComplianceReport& report) {
    const std::string json = report_to_json(report);

    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        sqlite3_int64 analysisId = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO compliance_analyses (workout_id, activity_id, ftp, score, grade, summary, "
                "segments_completed, segments_skipped, segments_total, algorithm_version, data_quality, report_json) "
                "VALUES (?,?,?,?,?,?,?,?,?,?,?,?) "
                "ON CONFLICT(workout_id, activity_id) DO UPDATE SET "
                "ftp=excluded.ftp, score=excluded.score, grade=excluded.grade, summary=excluded.summary, "
                "segments_completed=excluded.segments_completed, segments_skipped=excluded.segments_skipped, "
                "segments_total=excluded.segments_total, algorithm_version=excluded.algorithm_version, "
                "data_quality=excluded.data_quality, report_json=excluded.report_json "
                "RETURNING id;");

            const OverallCompliance& o = report.overall;
            bind_text(stmt.get(), 1, workoutId);
            bind_text(stmt.get(), 2, activityId);
            sqlite3_bind_double(stmt.get(), 3, report.metadata.ftpWatts);
            sqlite3_bind_double(stmt.get(), 4, o.score);
            bind_text(stmt.get(), 5, o.grade);
            bind_text(stmt.get(), 6, o.summary);
            sqlite3_bind_int(stmt.get(), 7, o.segmentsCompleted);
            sqlite3_bind_int(stmt.get(), 8, o.segmentsSkipped);
            sqlite3_bind_int(stmt.get(), 9, o.segmentsTotal);
            bind_text(stmt.get(), 10, report.metadata.algorithmVersion);
            bind_text(stmt.get(), 11, data_quality_to_string(report.metadata.dataQuality));
            bind_text(stmt.get(), 12, json);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                analysisId = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        if (analysisId < 0) {
            throw StorageError("Failed to insert/get analysis id");
        }

        {
            auto stmt = prepare_or_throw(db_, "DELETE FROM compliance_segments WHERE analysis_id=?;");
            sqlite3_bind_int64(stmt.get(), 1, analysisId);
            step_done_or_throw(db_, stmt.get());
        }

        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO compliance_segments (analysis_id, segment_index, segment_type, match_quality, "
                "planned_duration_sec, actual_duration_sec, actual_avg_power, power_compliance, zone_compliance, "
                "duration_compliance, overall_segment_score, assessment) VALUES (?,?,?,?,?,?,?,?,?,?,?,?);");

            for (const auto& seg : report.segments) {
                const bool skipped = seg.matchQuality == MatchQuality::Skipped;
                sqlite3_bind_int64(stmt.get(), 1, analysisId);
                sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(seg.segmentIndex));
                bind_text(stmt.get(), 3, step_type_to_string(seg.type));
                bind_text(stmt.get(), 4, match_quality_to_string(seg.matchQuality));
                sqlite3_bind_double(stmt.get(), 5, seg.plannedDurationSec);
                bind_optional(stmt.get(), 6, skipped ? std::nullopt : std::optional<double>(seg.actualDurationSec));
                bind_optional(stmt.get(), 7, seg.actualAvgPower);
                sqlite3_bind_double(stmt.get(), 8, seg.scores.power);
                sqlite3_bind_double(stmt.get(), 9, seg.scores.zone);
                sqlite3_bind_double(stmt.get(), 10, seg.scores.duration);
                sqlite3_bind_double(stmt.get(), 11, seg.scores.overall);
                bind_text(stmt.get(), 12, seg.assessment);

                step_done_or_throw(db_, stmt.get());
                sqlite3_reset(stmt.get());
            }
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            log(LogLevel::ERROR, std::string("ROLLBACK failed: ") + sqlite3_errmsg(db_));
        }
        throw;
    }

    log(LogLevel::INFO, "Saved compliance report " + workoutId + "/" + activityId + ": score " +
                            std::to_string(report.overall.score) + " grade " + report.overall.grade);
}

std::optional<std::string> ComplianceStore::load_report_json(const std::string& workoutId,
                                                             const std::string& activityId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT report_json FROM compliance_analyses WHERE workout_id=? AND activity_id=?;");
    bind_text(stmt.get(), 1, workoutId);
    bind_text(stmt.get(), 2, activityId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw StorageError(sqlite3_errmsg(db_));
    return column_text(stmt.get(), 0);
}

void ComplianceStore::save_alignment(const std::string& workoutId, const std::string& activityId,
                                     const StoredAlignment& stored) {
    const AlignedSeries& aligned = stored.aligned;

    std::vector<double> times;
    std::vector<double> watts;
    times.reserve(aligned.stream.size());
    watts.reserve(aligned.stream.size());
    for (const auto& s : aligned.stream) {
        times.push_back(s.timeOffsetSec);
        watts.push_back(s.powerWatts);
    }

    std::vector<std::int64_t> ranges;
    ranges.reserve(aligned.mapping.ranges.size() * 2);
    for (const auto& r : aligned.mapping.ranges) {
        ranges.push_back(r ? static_cast<std::int64_t>(r->first) : kNoRange);
        ranges.push_back(r ? static_cast<std::int64_t>(r->last) : kNoRange);
    }

    std::vector<std::int64_t> path;
    path.reserve(aligned.mapping.path.size() * 2);
    for (const auto& p : aligned.mapping.path) {
        path.push_back(static_cast<std::int64_t>(p.planned));
        path.push_back(static_cast<std::int64_t>(p.actual));
    }

    auto stmt = prepare_or_throw(db_,
        "INSERT INTO alignments (workout_id, activity_id, algorithm_version, config_summary, plan_fingerprint, "
        "planned_length, stream_length, times_blob, power_blob, ranges_blob, path_blob, planned_anchor, "
        "actual_anchor, band_offset, path_cost, updated_at) VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?, CURRENT_TIMESTAMP) "
        "ON CONFLICT(workout_id, activity_id) DO UPDATE SET "
        "algorithm_version=excluded.algorithm_version, config_summary=excluded.config_summary, "
        "plan_fingerprint=excluded.plan_fingerprint, planned_length=excluded.planned_length, "
        "stream_length=excluded.stream_length, times_blob=excluded.times_blob, power_blob=excluded.power_blob, "
        "ranges_blob=excluded.ranges_blob, path_blob=excluded.path_blob, planned_anchor=excluded.planned_anchor, "
        "actual_anchor=excluded.actual_anchor, band_offset=excluded.band_offset, path_cost=excluded.path_cost, "
        "updated_at=CURRENT_TIMESTAMP;");

    bind_text(stmt.get(), 1, workoutId);
    bind_text(stmt.get(), 2, activityId);
    bind_text(stmt.get(), 3, stored.algorithmVersion);
    bind_text(stmt.get(), 4, stored.configSummary);
    bind_text(stmt.get(), 5, stored.planFingerprint);
    sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(aligned.plannedLength));
    sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(aligned.stream.size()));
    bind_blob(stmt.get(), 8, times);
    bind_blob(stmt.get(), 9, watts);
    bind_blob(stmt.get(), 10, ranges);
    bind_blob(stmt.get(), 11, path);
    bind_optional_index(stmt.get(), 12, aligned.diagnostics.anchors.planned);
    bind_optional_index(stmt.get(), 13, aligned.diagnostics.anchors.actual);
    sqlite3_bind_int64(stmt.get(), 14, aligned.diagnostics.offset);
    sqlite3_bind_double(stmt.get(), 15, aligned.diagnostics.pathCost);

    step_done_or_throw(db_, stmt.get());
    log(LogLevel::INFO, "Saved alignment " + workoutId + "/" + activityId + " (" +
                            std::to_string(aligned.plannedLength) + " planned, " +
                            std::to_string(aligned.stream.size()) + " actual samples)");
}

std::optional<StoredAlignment> ComplianceStore::load_alignment(const std::string& workoutId,
                                                               const std::string& activityId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT algorithm_version, config_summary, plan_fingerprint, planned_length, stream_length, "
        "times_blob, power_blob, ranges_blob, path_blob, planned_anchor, actual_anchor, band_offset, path_cost "
        "FROM alignments WHERE workout_id=? AND activity_id=?;");
    bind_text(stmt.get(), 1, workoutId);
    bind_text(stmt.get(), 2, activityId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw StorageError(sqlite3_errmsg(db_));

    StoredAlignment stored;
    stored.algorithmVersion = column_text(stmt.get(), 0);
    stored.configSummary = column_text(stmt.get(), 1);
    stored.planFingerprint = column_text(stmt.get(), 2);

    AlignedSeries& aligned = stored.aligned;
    aligned.plannedLength = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 3));
    const auto streamLength = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 4));

    const auto times = column_blob<double>(stmt.get(), 5);
    const auto watts = column_blob<double>(stmt.get(), 6);
    const auto ranges = column_blob<std::int64_t>(stmt.get(), 7);
    const auto path = column_blob<std::int64_t>(stmt.get(), 8);
    if (times.size() != streamLength || watts.size() != streamLength || ranges.size() != aligned.plannedLength * 2 ||
        path.size() % 2 != 0) {
        throw StorageError("Stored alignment " + workoutId + "/" + activityId + " has inconsistent blob sizes");
    }

    aligned.stream.resize(streamLength);
    for (std::size_t k = 0; k < streamLength; ++k) {
        aligned.stream[k].timeOffsetSec = times[k];
        aligned.stream[k].powerWatts = watts[k];
    }

    aligned.mapping.ranges.resize(aligned.plannedLength);
    for (std::size_t k = 0; k < aligned.plannedLength; ++k) {
        const std::int64_t first = ranges[2 * k];
        const std::int64_t last = ranges[2 * k + 1];
        if (first != kNoRange) {
            aligned.mapping.ranges[k] = ActualRange{static_cast<std::size_t>(first), static_cast<std::size_t>(last)};
        }
    }

    aligned.mapping.path.reserve(path.size() / 2);
    for (std::size_t k = 0; k + 1 < path.size(); k += 2) {
        aligned.mapping.path.push_back({static_cast<std::size_t>(path[k]), static_cast<std::size_t>(path[k + 1])});
    }

    AlignmentDiagnostics& diag = aligned.diagnostics;
    diag.algorithm = contract::ALIGNER_NAME;
    diag.version = stored.algorithmVersion;
    diag.configSummary = stored.configSummary;
    diag.anchors.planned = column_optional_index(stmt.get(), 9);
    diag.anchors.actual = column_optional_index(stmt.get(), 10);
    diag.offset = static_cast<long>(sqlite3_column_int64(stmt.get(), 11));
    diag.pathCost = sqlite3_column_double(stmt.get(), 12);
    diag.pathLength = aligned.mapping.path.size();

    return stored;
}

}  // namespace wattline
