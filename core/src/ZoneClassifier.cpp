#include "wattline/ZoneClassifier.h"
#include "wattline/CoreContract.h"
#include "wattline/Errors.h"

#include <cmath>
#include <string>

namespace wattline {

namespace {

void require_ftp(double ftpWatts) {
    if (!std::isfinite(ftpWatts) || ftpWatts <= 0.0) {
        throw InvalidInputError("FTP must be > 0, got " + std::to_string(ftpWatts));
    }
}

}  // namespace

int zone_for_percent(double pctFtp) {
    int zone = 1;
    for (double upper : contract::ZONE_UPPER_PCT) {
        if (pctFtp <= upper) return zone;
        ++zone;
    }
    return contract::ZONE_COUNT;
}

int zone_for_power(double watts, double ftpWatts) {
    require_ftp(ftpWatts);
    return zone_for_percent(watts / ftpWatts * 100.0);
}

std::array<ZoneBounds, 6> zone_bounds_watts(double ftpWatts) {
    require_ftp(ftpWatts);
    std::array<ZoneBounds, 6> bounds{};
    double low = 0.0;
    for (std::size_t z = 0; z < bounds.size(); ++z) {
        bounds[z].zone = static_cast<int>(z) + 1;
        bounds[z].lowWatts = low;
        if (z < contract::ZONE_UPPER_PCT.size()) {
            const double high = contract::ZONE_UPPER_PCT[z] * ftpWatts / 100.0;
            bounds[z].highWatts = high;
            low = high;
        }
    }
    return bounds;
}

}  // namespace wattline
