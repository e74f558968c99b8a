#pragma once

/**
 * CoreContract.h - Wattline Core System Constants
 *
 * Contract-level constants for the compliance engine. Reports, stored
 * alignments and downstream consumers (report renderer, coaching prompts)
 * depend on these values, so changing any of them changes scores for
 * historical activities. Bump ALGORITHM_VERSION when they change.
 *
 * Runtime-tunable knobs live in AnalyzerConfig (Config.h); their defaults
 * come from here.
 */

#include <array>
#include <cstddef>

namespace wattline {
namespace contract {

// ============================================================================
// Timeline
// ============================================================================

/**
 * SAMPLE_RATE_HZ - Planned workouts expand to one target per second, and the
 * recorded stream is consumed sample-by-sample at the same nominal rate.
 */
constexpr double SAMPLE_RATE_HZ = 1.0;

/**
 * MAX_STREAM_SAMPLES - Safety bound on the actual stream (48 h at 1 Hz).
 * Longer streams fail fast with StreamTooLargeError.
 */
constexpr std::size_t MAX_STREAM_SAMPLES = 48 * 3600;

// ============================================================================
// Power Zones (% of FTP, inclusive upper bounds)
// ============================================================================

/**
 * ZONE_UPPER_PCT - Upper bound of Z1..Z5. Anything above the last bound is Z6.
 *
 *   Z1 <= 55, Z2 <= 75, Z3 <= 90, Z4 <= 105, Z5 <= 120, Z6 > 120
 */
constexpr std::array<double, 5> ZONE_UPPER_PCT = {55.0, 75.0, 90.0, 105.0, 120.0};

constexpr int ZONE_COUNT = 6;

// ============================================================================
// Anchor Detection
// ============================================================================

/**
 * Empirically tuned defaults. The threshold is relative to each sequence's
 * own high percentile, so planned watts and recorded watts are comparable
 * even when the athlete rode the whole session above or below target.
 */
constexpr double ANCHOR_PERCENTILE = 0.90;
constexpr double ANCHOR_HIGH_RATIO = 0.9;
constexpr std::size_t ANCHOR_MIN_RUN_SEC = 45;
constexpr std::size_t ANCHOR_SEARCH_WINDOW_SEC = 600;

// ============================================================================
// DTW Alignment
// ============================================================================

constexpr std::size_t DTW_DOWNSAMPLE = 1;
constexpr std::size_t DTW_WINDOW_SEC = 90;     // Sakoe-Chiba half-width
constexpr double DTW_PENALTY = 0.05;           // watts per sample of offset from band center
constexpr std::size_t DTW_PSI_SEC = 10;        // free leading/trailing skip
constexpr bool DTW_USE_ANCHOR = true;

// ============================================================================
// Scoring
// ============================================================================

/**
 * Sub-score weights for overall_segment_score. Must sum to 1.
 */
constexpr double WEIGHT_POWER = 0.5;
constexpr double WEIGHT_ZONE = 0.3;
constexpr double WEIGHT_DURATION = 0.2;

/**
 * ZONE_DISTANCE_CREDIT - zone_compliance by |dominant - planned| zone distance.
 * Distances past the end of the table score 0.
 */
constexpr std::array<double, 3> ZONE_DISTANCE_CREDIT = {100.0, 60.0, 25.0};

/**
 * MIN_BAND_FRACTION - Floor for the power band width used to scale
 * out-of-band deviation, as a fraction of the target midpoint. Keeps
 * single-value targets (low == high) from collapsing to 0 on a 1 W miss.
 */
constexpr double MIN_BAND_FRACTION = 0.05;

// Match quality thresholds on overall_segment_score
constexpr double QUALITY_EXCELLENT = 90.0;
constexpr double QUALITY_GOOD = 75.0;
constexpr double QUALITY_FAIR = 60.0;

// Grade thresholds on overall score
constexpr double GRADE_A = 90.0;
constexpr double GRADE_B = 80.0;
constexpr double GRADE_C = 70.0;
constexpr double GRADE_D = 60.0;

// ============================================================================
// Stream Annotation
// ============================================================================

/**
 * Pause detection: sustained power below PAUSE_POWER_W for at least
 * PAUSE_MIN_SEC samples (stops, equipment adjustments). Annotation only.
 */
constexpr double PAUSE_POWER_W = 20.0;
constexpr std::size_t PAUSE_MIN_SEC = 30;

/**
 * DATA_QUALITY_MIN_NONZERO - Fraction of samples > 0 W required for the
 * stream to count as "good" rather than "partial".
 */
constexpr double DATA_QUALITY_MIN_NONZERO = 0.8;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * ALGORITHM_VERSION - Reported as metadata.algorithm_version. Stored
 * alignments are only reused when the version matches.
 */
constexpr const char* ALGORITHM_VERSION = "2.0.0";

constexpr const char* ALIGNER_NAME = "banded-dtw";

}  // namespace contract
}  // namespace wattline
