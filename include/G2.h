#pragma once
#include <span>
#include <string>
#include <vector>

#include "Histograms.h"
#include "Timestamps.h"

/// @file
/// g2 extraction from a raw event stream: channel selection, stop delay and
/// range offset handling on top of pairwiseHistogram, and a peak finder used
/// to read the correlation delay off the resulting histogram.

/// Times of the events whose pattern is exactly channel `channel` alone.
/// Simultaneous multi-channel records are left out.
std::vector<Timestamp> splitChannel(std::span<const Event> events, int channel);

struct G2Result {
    std::vector<long long> histogram;
    /// Left edge of each bin, in picoseconds.
    std::vector<Timestamp> timeAxisPs;
    size_t startCount = 0;
    size_t stopCount = 0;
    /// Last minus first event time of the whole stream (0 when empty).
    Timestamp spanPs = 0;
};

/// Builds the start/stop histogram between `startChannel` and `stopChannel`
/// (0-based, at most 3). Stop times are shifted by `stopDelayPs - minRangePs`
/// so the histogram covers [minRangePs, minRangePs + bins*binWidth).
G2Result extractG2(std::span<const Event> events, const HistogramConfig &config,
                   int startChannel = 0, int stopChannel = 1,
                   Timestamp stopDelayPs = 0, Timestamp minRangePs = 0);

struct HistogramPeak {
    size_t bin = 0;
    long long counts = 0;
    /// Left edge of the peak bin, `offsetPs + bin * binWidth`.
    Timestamp delayPs = 0;
};

/// First maximal bin of `histogram`.
HistogramPeak findPeak(const std::vector<long long> &histogram,
                       const HistogramConfig &config, Timestamp offsetPs = 0);

/// Writes `timeAxisPs` (as ns) followed by one column per histogram to
/// `filename` as CSV with the given header line. All columns must have the
/// axis length. Throws std::runtime_error when the file cannot be written.
void writeHistogramsToFile(const std::vector<Timestamp> &timeAxisPs,
                           const std::vector<const std::vector<long long> *> &columns,
                           const std::string &header,
                           const std::string &filename);
