#pragma once

#include <array>
#include <optional>

namespace wattline {

struct ZoneBounds {
    int zone{1};
    double lowWatts{0.0};
    std::optional<double> highWatts;  // inclusive; empty for Z6
};

// %FTP -> zone 1..6 (inclusive upper bounds, see contract::ZONE_UPPER_PCT).
int zone_for_percent(double pctFtp);

// Watts -> zone 1..6. Throws InvalidInputError when ftpWatts <= 0.
int zone_for_power(double watts, double ftpWatts);

// Watt boundaries of Z1..Z6 for a given FTP.
std::array<ZoneBounds, 6> zone_bounds_watts(double ftpWatts);

}  // namespace wattline
