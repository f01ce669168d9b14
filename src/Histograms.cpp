#include "Histograms.h"

// Cursor-based start/stop histograms. Every scan keeps an index into the stop
// sequence that only moves forward: since starts are visited in ascending
// order, a stop that precedes the current start precedes every later start
// too, so the total work is O(N1 + N2) per pass.

#include <algorithm>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "Errors.h"

namespace {

// Advances `cursor` past every stop earlier than `start` and returns the index
// of the nearest stop at or after `start` (stops.size() when none is left).
inline size_t nearestStop(std::span<const Timestamp> stops, size_t &cursor,
                          Timestamp start) {
    while (cursor < stops.size() && stops[cursor] < start)
        ++cursor;
    return cursor;
}

inline size_t binIndex(Timestamp dt, Timestamp binWidthPs) {
    return static_cast<size_t>(dt / binWidthPs);
}

void accumulateRange(std::span<const Timestamp> t1,
                     std::span<const Timestamp> t2, size_t cursor,
                     const HistogramConfig &config,
                     std::vector<long long> &histogram) {
    const Timestamp range = config.rangePs();
    for (const Timestamp start : t1) {
        const size_t j = nearestStop(t2, cursor, start);
        if (j == t2.size())
            break; // no stops left for this or any later start
        const Timestamp dt = t2[j] - start;
        if (dt < range)
            ++histogram[binIndex(dt, config.binWidthPs)];
    }
}

// One heralded pass. For each herald the nearest `first` and `second` stops
// are located with two independent cursors local to this call.
void conditionalPass(std::span<const Timestamp> herald,
                     std::span<const Timestamp> first,
                     std::span<const Timestamp> second,
                     const HistogramConfig &config,
                     std::vector<long long> &firstFromHerald,
                     std::vector<long long> &secondFromFirst) {
    const Timestamp range = config.rangePs();
    size_t firstCursor = 0;
    size_t secondCursor = 0;

    for (const Timestamp a : herald) {
        const size_t i = nearestStop(first, firstCursor, a);
        const size_t k = nearestStop(second, secondCursor, a);
        if (i == first.size())
            break;

        const Timestamp firstDelay = first[i] - a;
        if (firstDelay >= range)
            continue;
        ++firstFromHerald[binIndex(firstDelay, config.binWidthPs)];

        if (k == second.size())
            continue;
        const Timestamp secondDelay = second[k] - a;
        if (secondDelay >= range || second[k] < first[i])
            continue;
        // secondDelay < range bounds this separation as well.
        ++secondFromFirst[binIndex(second[k] - first[i], config.binWidthPs)];
    }
}

} // namespace

HistogramConfig HistogramConfig::fromNanoseconds(int bins, double binWidthNs) {
    HistogramConfig config;
    config.bins = bins;
    config.binWidthPs = nanosecondsToTimestamp(binWidthNs);
    return config;
}

void validateConfig(const HistogramConfig &config) {
    if (config.bins <= 0)
        throw ConfigurationError("bins must be positive, got " +
                                 std::to_string(config.bins));
    if (config.binWidthPs <= 0)
        throw ConfigurationError("bin width must be positive in ps, got " +
                                 std::to_string(config.binWidthPs));
}

std::vector<long long> pairwiseHistogram(std::span<const Timestamp> t1,
                                         std::span<const Timestamp> t2,
                                         const HistogramConfig &config) {
    validateConfig(config);
    debugCheckAscending(t1, "t1");
    debugCheckAscending(t2, "t2");

    std::vector<long long> histogram(static_cast<size_t>(config.bins), 0);
    accumulateRange(t1, t2, 0, config, histogram);
    return histogram;
}

MaskedHistogram maskedPairwiseHistogram(std::span<const Timestamp> t1,
                                        std::span<const Timestamp> t2,
                                        const HistogramConfig &config) {
    validateConfig(config);
    debugCheckAscending(t1, "t1");
    debugCheckAscending(t2, "t2");

    MaskedHistogram result;
    result.histogram.assign(static_cast<size_t>(config.bins), 0);
    result.mask1.assign(t1.size(), false);
    result.mask2.assign(t2.size(), false);

    const Timestamp range = config.rangePs();
    size_t cursor = 0;
    for (size_t i = 0; i < t1.size(); ++i) {
        const size_t j = nearestStop(t2, cursor, t1[i]);
        if (j == t2.size())
            break;
        const Timestamp dt = t2[j] - t1[i];
        if (dt >= range)
            continue;
        ++result.histogram[binIndex(dt, config.binWidthPs)];
        result.mask1[i] = true;
        result.mask2[j] = true;
    }
    return result;
}

std::vector<Timestamp> applyMask(std::span<const Timestamp> times,
                                 const std::vector<bool> &mask) {
    if (mask.size() != times.size())
        throw std::invalid_argument("mask size must match sequence size");
    std::vector<Timestamp> kept;
    for (size_t i = 0; i < times.size(); ++i) {
        if (mask[i])
            kept.push_back(times[i]);
    }
    return kept;
}

TripleHistogram tripleConditionalHistogram(std::span<const Timestamp> t1,
                                           std::span<const Timestamp> t2,
                                           std::span<const Timestamp> t3,
                                           const HistogramConfig &config) {
    validateConfig(config);
    debugCheckAscending(t1, "t1");
    debugCheckAscending(t2, "t2");
    debugCheckAscending(t3, "t3");

    const size_t bins = static_cast<size_t>(config.bins);
    TripleHistogram result{std::vector<long long>(bins, 0),
                           std::vector<long long>(bins, 0),
                           std::vector<long long>(bins, 0),
                           std::vector<long long>(bins, 0)};

    // Pass A: t2 ahead of t3.
    conditionalPass(t1, t2, t3, config, result.ba, result.cb);
    // Pass B: t3 ahead of t2.
    conditionalPass(t1, t3, t2, config, result.ca, result.bc);
    return result;
}

std::vector<long long>
pairwiseHistogramPartitioned(std::span<const Timestamp> t1,
                             std::span<const Timestamp> t2,
                             const HistogramConfig &config, int partitions) {
    validateConfig(config);
    debugCheckAscending(t1, "t1");
    debugCheckAscending(t2, "t2");

    if (partitions <= 0) {
#ifdef _OPENMP
        partitions = omp_get_max_threads();
#else
        partitions = 1;
#endif
    }
    const size_t parts = std::max<size_t>(
        1, std::min(static_cast<size_t>(partitions), t1.size()));
    const size_t bins = static_cast<size_t>(config.bins);
    const size_t chunk = (t1.size() + parts - 1) / parts;

    std::vector<std::vector<long long>> partial(
        parts, std::vector<long long>(bins, 0));

#pragma omp parallel for
    for (long long p = 0; p < static_cast<long long>(parts); ++p) {
        const size_t begin = static_cast<size_t>(p) * chunk;
        if (begin >= t1.size())
            continue;
        const size_t end = std::min(t1.size(), begin + chunk);
        // Greatest lower bound for this range's first start.
        const size_t cursor = static_cast<size_t>(
            std::lower_bound(t2.begin(), t2.end(), t1[begin]) - t2.begin());
        accumulateRange(t1.subspan(begin, end - begin), t2, cursor, config,
                        partial[static_cast<size_t>(p)]);
    }

    std::vector<long long> histogram(bins, 0);
    for (const auto &part : partial) {
        for (size_t k = 0; k < bins; ++k)
            histogram[k] += part[k];
    }
    return histogram;
}
