#include "wattline/DtwAligner.h"
#include "wattline/Errors.h"
#include "wattline/Logging.h"
#include "wattline/Normalization.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace wattline {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

enum Move : std::uint8_t { kNone = 0, kStart = 1, kDiag = 2, kUp = 3, kLeft = 4 };

// Sakoe-Chiba band of constant half-width around j = i - offset.
struct Band {
    long n{0};
    long m{0};
    long window{0};
    long offset{0};

    long lo(long i) const { return std::max(0L, i - offset - window); }
    long hi(long i) const { return std::min(m - 1, i - offset + window); }

    // Planned rows that hold at least one cell.
    long first_row() const { return std::max(0L, offset - window); }
    long last_row() const { return std::min(n - 1, m - 1 + offset + window); }
    bool empty() const { return first_row() > last_row(); }
};

}  // namespace

DtwAligner::DtwAligner(DtwConfig config) : config_(std::move(config)) {
    config_.validate_or_throw();
}

DtwResult DtwAligner::align_with_anchors(const std::vector<double>& planned,
                                         const std::vector<double>& actual,
                                         std::optional<std::size_t> plannedAnchor,
                                         std::optional<std::size_t> actualAnchor) const {
    const std::size_t ds = config_.downsample;
    const std::vector<double> p = block_average(planned, ds);
    const std::vector<double> a = block_average(actual, ds);
    if (p.size() < 2 || a.size() < 2) {
        throw InsufficientDataError("DTW needs at least 2 samples per side after downsampling (planned=" +
                                    std::to_string(p.size()) + ", actual=" + std::to_string(a.size()) + ")");
    }

    const long n = static_cast<long>(p.size());
    const long m = static_cast<long>(a.size());
    const long window = std::max(1L, static_cast<long>(config_.window / ds));
    const long psi = static_cast<long>(config_.psi / ds);

    DtwResult result;
    result.plannedSamples = p.size();
    result.actualSamples = a.size();

    long offset = 0;
    if (config_.anchor && plannedAnchor && actualAnchor) {
        offset = (static_cast<long>(*plannedAnchor) - static_cast<long>(*actualAnchor)) / static_cast<long>(ds);
        result.anchored = true;
    }
    Band band{n, m, window, offset};
    if (band.empty()) {
        log(LogLevel::DEBUG, "DTW: anchored band (offset " + std::to_string(offset) +
                                 ") misses one of the sequences, using the unanchored band");
        offset = 0;
        result.anchored = false;
        band = Band{n, m, window, 0};
    }
    result.offset = offset * static_cast<long>(ds);

    const long iFirst = band.first_row();
    const long iLast = band.last_row();
    const long jFirst = band.lo(iFirst);
    const long jLast = m - 1;

    // Banded move table, row-major over each row's [lo, hi].
    std::vector<std::size_t> rowStart(static_cast<std::size_t>(iLast - iFirst) + 2, 0);
    for (long i = iFirst; i <= iLast; ++i) {
        const std::size_t r = static_cast<std::size_t>(i - iFirst);
        rowStart[r + 1] = rowStart[r] + static_cast<std::size_t>(band.hi(i) - band.lo(i) + 1);
    }
    std::vector<std::uint8_t> moves(rowStart.back(), kNone);
    result.bandCells = moves.size();
    auto move_at = [&](long i, long j) -> std::uint8_t& {
        return moves[rowStart[static_cast<std::size_t>(i - iFirst)] + static_cast<std::size_t>(j - band.lo(i))];
    };

    std::vector<double> prev;
    std::vector<double> cur;
    long prevLo = 0;
    long prevHi = -1;

    double bestCost = kInf;
    long bestI = -1;
    long bestJ = -1;

    for (long i = iFirst; i <= iLast; ++i) {
        const long lo = band.lo(i);
        const long hi = band.hi(i);
        cur.assign(static_cast<std::size_t>(hi - lo + 1), kInf);

        for (long j = lo; j <= hi; ++j) {
            double best = kInf;
            std::uint8_t mv = kNone;

            const bool entry = (i == iFirst && j <= jFirst + psi) || (j == jFirst && i <= iFirst + psi);
            if (entry) {
                best = 0.0;
                mv = kStart;
            } else {
                if (i > iFirst && j - 1 >= prevLo && j - 1 <= prevHi && prev[j - 1 - prevLo] < best) {
                    best = prev[j - 1 - prevLo];
                    mv = kDiag;
                }
                if (i > iFirst && j >= prevLo && j <= prevHi && prev[j - prevLo] < best) {
                    best = prev[j - prevLo];
                    mv = kUp;
                }
                if (j > lo && cur[j - 1 - lo] < best) {
                    best = cur[j - 1 - lo];
                    mv = kLeft;
                }
            }
            if (mv == kNone) continue;

            const double local = std::abs(p[i] - a[j]) + config_.penalty * std::abs(static_cast<double>(i - j - offset));
            cur[j - lo] = local + best;
            move_at(i, j) = mv;

            // Open ends: the path stops where either sequence runs out.
            const bool terminal = (i == iLast) || (j == jLast);
            if (terminal && cur[j - lo] < bestCost) {
                bestCost = cur[j - lo];
                bestI = i;
                bestJ = j;
            }
        }

        prev.swap(cur);
        prevLo = lo;
        prevHi = hi;
    }

    if (bestI < 0) {
        throw WattlineError("DTW found no complete warping path");
    }
    result.pathCost = bestCost;

    // Backtrack in downsampled coordinates.
    std::vector<IndexPair> dsPath;
    long i = bestI;
    long j = bestJ;
    while (true) {
        dsPath.push_back({static_cast<std::size_t>(i), static_cast<std::size_t>(j)});
        const std::uint8_t mv = move_at(i, j);
        if (mv == kStart) break;
        if (mv == kDiag) {
            --i;
            --j;
        } else if (mv == kUp) {
            --i;
        } else if (mv == kLeft) {
            --j;
        } else {
            throw WattlineError("DTW backtrack reached an unvisited cell");
        }
    }
    std::reverse(dsPath.begin(), dsPath.end());

    // Upsample: each downsampled pair covers a block of planned and actual samples.
    const std::size_t nOrig = planned.size();
    const std::size_t mOrig = actual.size();
    AlignmentMapping& mapping = result.mapping;
    mapping.ranges.assign(nOrig, std::nullopt);
    mapping.path.reserve(dsPath.size());
    for (const auto& pair : dsPath) {
        mapping.path.push_back({pair.planned * ds, pair.actual * ds});
        const std::size_t pBegin = pair.planned * ds;
        const std::size_t pEnd = std::min(pBegin + ds, nOrig);
        const std::size_t aFirst = pair.actual * ds;
        const std::size_t aLast = std::min(aFirst + ds, mOrig) - 1;
        for (std::size_t k = pBegin; k < pEnd; ++k) {
            auto& r = mapping.ranges[k];
            if (!r) {
                r = ActualRange{aFirst, aLast};
            } else {
                r->first = std::min(r->first, aFirst);
                r->last = std::max(r->last, aLast);
            }
        }
    }

    // Ranges of consecutive planned indices never cross.
    std::optional<ActualRange> previous;
    for (auto& r : mapping.ranges) {
        if (!r) continue;
        if (previous) {
            r->first = std::max(r->first, previous->first);
            r->last = std::max(r->last, previous->last);
        }
        previous = r;
    }

    return result;
}

}  // namespace wattline
