#include "wattline/Config.h"
#include "wattline/Errors.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace wattline {

void AnchorConfig::validate_or_throw() const {
    if (!(highRatio > 0.0) || highRatio > 2.0) {
        throw InvalidInputError("AnchorConfig: highRatio must be in (0, 2]");
    }
    if (!(percentile > 0.0) || percentile > 1.0) {
        throw InvalidInputError("AnchorConfig: percentile must be in (0, 1]");
    }
    if (minRun < 1) {
        throw InvalidInputError("AnchorConfig: minRun must be >= 1");
    }
}

void DtwConfig::validate_or_throw() const {
    if (downsample < 1) {
        throw InvalidInputError("DtwConfig: downsample must be >= 1");
    }
    if (window < 1) {
        throw InvalidInputError("DtwConfig: window must be >= 1");
    }
    if (!std::isfinite(penalty) || penalty < 0.0) {
        throw InvalidInputError("DtwConfig: penalty must be finite and >= 0");
    }
}

std::string DtwConfig::summary() const {
    std::ostringstream oss;
    oss << "downsample=" << downsample << ";window=" << window << ";penalty=" << std::setprecision(6)
        << penalty << ";psi=" << psi << ";anchor=" << (anchor ? 1 : 0);
    return oss.str();
}

void ScoringConfig::validate_or_throw() const {
    if (weightPower < 0.0 || weightZone < 0.0 || weightDuration < 0.0) {
        throw InvalidInputError("ScoringConfig: weights must be >= 0");
    }
    const double sum = weightPower + weightZone + weightDuration;
    if (std::abs(sum - 1.0) > 1e-6) {
        throw InvalidInputError("ScoringConfig: weights must sum to 1");
    }
}

void AnalyzerConfig::validate_or_throw() const {
    anchor.validate_or_throw();
    dtw.validate_or_throw();
    scoring.validate_or_throw();
    if (maxStreamSamples < 2) {
        throw InvalidInputError("AnalyzerConfig: maxStreamSamples must be >= 2");
    }
}

}  // namespace wattline
