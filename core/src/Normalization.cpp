#include "wattline/Normalization.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace wattline {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double quantile(std::vector<double> v, double q) {
    if (v.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);

    const double pos = q * static_cast<double>(v.size() - 1);
    const std::size_t k = static_cast<std::size_t>(std::floor(pos));
    const std::size_t k2 = std::min(k + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(k);

    std::nth_element(v.begin(), v.begin() + k, v.end());
    const double a = v[k];
    if (k2 == k) return a;

    // everything right of k is >= a, so the next order statistic is its minimum
    const double b = *std::min_element(v.begin() + k + 1, v.end());
    return a + frac * (b - a);
}

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::vector<double> block_average(const std::vector<double>& x, std::size_t factor) {
    if (factor <= 1) return x;
    std::vector<double> out;
    out.reserve((x.size() + factor - 1) / factor);
    for (std::size_t a = 0; a < x.size(); a += factor) {
        const std::size_t b = std::min(x.size(), a + factor);
        double acc = 0.0;
        for (std::size_t j = a; j < b; ++j) acc += x[j];
        out.push_back(acc / static_cast<double>(b - a));
    }
    return out;
}

} // namespace wattline
