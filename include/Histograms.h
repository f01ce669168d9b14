#pragma once
#include <span>
#include <vector>

#include "Timestamps.h"

/// @file
/// Start/stop time-difference histograms (g2 and heralded g2). All functions
/// take ascending timestamp spans and scan them with forward-only cursors, so
/// the cost is linear in the input size rather than quadratic.

/// Histogram geometry. Bin k covers dt in [k*binWidthPs, (k+1)*binWidthPs).
struct HistogramConfig {
    int bins = 500;
    Timestamp binWidthPs = 2 * kPicosecondsPerNanosecond;

    /// Total covered range; dt at or beyond this is dropped.
    Timestamp rangePs() const { return static_cast<Timestamp>(bins) * binWidthPs; }

    static HistogramConfig fromNanoseconds(int bins, double binWidthNs);
};

/// Throws ConfigurationError unless bins and bin width are positive.
void validateConfig(const HistogramConfig &config);

/// Histogram of t2 - t1 where, for every start, only the nearest stop at or
/// after it is counted. The stop cursor never moves backwards, so a stop that
/// lies before some start is never revisited for later starts.
std::vector<long long> pairwiseHistogram(std::span<const Timestamp> t1,
                                         std::span<const Timestamp> t2,
                                         const HistogramConfig &config = {});

struct MaskedHistogram {
    std::vector<long long> histogram;
    /// mask1[i] is true iff t1[i] was paired with a stop inside the range.
    std::vector<bool> mask1;
    /// mask2[j] is true iff t2[j] was the stop of at least one recorded pair.
    std::vector<bool> mask2;
};

/// Same as pairwiseHistogram, plus participation masks for both inputs.
MaskedHistogram maskedPairwiseHistogram(std::span<const Timestamp> t1,
                                        std::span<const Timestamp> t2,
                                        const HistogramConfig &config = {});

/// Keeps the elements of `times` whose mask entry is set.
std::vector<Timestamp> applyMask(std::span<const Timestamp> times,
                                 const std::vector<bool> &mask);

struct TripleHistogram {
    std::vector<long long> ba; ///< t2 - t1, pass A
    std::vector<long long> ca; ///< t3 - t1, pass B
    std::vector<long long> cb; ///< t3 - t2 given herald, pass A
    std::vector<long long> bc; ///< t2 - t3 given herald, pass B
};

/// Heralded histograms for herald `t1` and signals `t2`, `t3`.
///
/// Pass A takes, for each herald, the nearest t2 stop and the nearest t3 stop
/// at or after the herald. The herald-t2 delay goes into `ba`; when both are in
/// range and the t3 stop is not earlier than the t2 stop, their separation
/// goes into `cb`. Pass B is the same with t2 and t3 exchanged, filling `ca`
/// and `bc`. Each pass starts with its own fresh cursors.
TripleHistogram tripleConditionalHistogram(std::span<const Timestamp> t1,
                                           std::span<const Timestamp> t2,
                                           std::span<const Timestamp> t3,
                                           const HistogramConfig &config = {});

/// pairwiseHistogram split into `partitions` contiguous ranges of t1 that run
/// on OpenMP threads. Each range seeds its cursor with a binary search into
/// t2; the summed result is identical to the sequential one. `partitions <= 0`
/// picks one range per available thread.
std::vector<long long>
pairwiseHistogramPartitioned(std::span<const Timestamp> t1,
                             std::span<const Timestamp> t2,
                             const HistogramConfig &config = {},
                             int partitions = 0);
