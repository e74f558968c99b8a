#pragma once
#include <vector>
#include <cstddef>

namespace wattline {

// ---------- summary statistics ----------
double mean(const std::vector<double>& v);
double quantile(std::vector<double> values, double q); // linear interpolation between order statistics

// round half away from zero to a fixed number of decimals
double round_to(double value, int decimals);

// ---------- resampling ----------

// Average consecutive blocks of `factor` samples; a short tail forms its own block.
std::vector<double> block_average(const std::vector<double>& x, std::size_t factor);

} // namespace wattline
