#pragma once

#include "wattline/CoreContract.h"

#include <cstddef>
#include <string>

namespace wattline {

// Anchor detection knobs. Lengths are in samples (seconds at 1 Hz).
struct AnchorConfig {
    double highRatio{contract::ANCHOR_HIGH_RATIO};
    double percentile{contract::ANCHOR_PERCENTILE};
    std::size_t minRun{contract::ANCHOR_MIN_RUN_SEC};
    std::size_t searchWindow{contract::ANCHOR_SEARCH_WINDOW_SEC};

    void validate_or_throw() const;
};

/**
 * Banded DTW knobs. window, psi and the anchor offset are given in original
 * samples; the aligner divides them by downsample.
 */
struct DtwConfig {
    std::size_t downsample{contract::DTW_DOWNSAMPLE};
    std::size_t window{contract::DTW_WINDOW_SEC};
    double penalty{contract::DTW_PENALTY};
    std::size_t psi{contract::DTW_PSI_SEC};
    bool anchor{contract::DTW_USE_ANCHOR};

    void validate_or_throw() const;

    // Stable text form, stored beside persisted alignments.
    std::string summary() const;
};

struct ScoringConfig {
    double weightPower{contract::WEIGHT_POWER};
    double weightZone{contract::WEIGHT_ZONE};
    double weightDuration{contract::WEIGHT_DURATION};

    void validate_or_throw() const;
};

struct AnalyzerConfig {
    AnchorConfig anchor;
    DtwConfig dtw;
    ScoringConfig scoring;
    std::size_t maxStreamSamples{contract::MAX_STREAM_SAMPLES};

    static AnalyzerConfig defaults() { return AnalyzerConfig{}; }

    void validate_or_throw() const;
};

}  // namespace wattline
