#pragma once
#include <span>
#include <vector>

#include "Timestamps.h"

/// @file
/// Coarse delay search between two detector channels. Both series are folded
/// onto a circular buffer of 2^bufferLengthLog2 samples of `resolutionPs`
/// each, and the delay is read off the maximum of their cross-correlation,
/// computed with FFTW. Useful to find the cable delay before building a fine
/// histogram around it.

constexpr int kMaxPeakFinderBufferLog2 = 28;

struct PeakFinderResult {
    /// Delay of t2 relative to t1, in [0, 2^bufferLengthLog2 * resolutionPs).
    Timestamp delayPs = 0;
    /// correlation[k] = number of (t1, t2) pairs whose folded samples are k
    /// apart, t2 after t1 modulo the buffer length.
    std::vector<long long> correlation;
    /// k * resolutionPs for every correlation sample.
    std::vector<Timestamp> timeAxisPs;
};

/// Throws ConfigurationError when `resolutionPs` is not positive or
/// `bufferLengthLog2` is outside [1, kMaxPeakFinderBufferLog2]. Negative
/// times fold like non-negative ones (sample index taken modulo the buffer).
PeakFinderResult peakFinder(std::span<const Timestamp> t1,
                            std::span<const Timestamp> t2,
                            Timestamp resolutionPs, int bufferLengthLog2);
