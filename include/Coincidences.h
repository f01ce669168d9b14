#pragma once
#include <span>
#include <vector>

#include "Timestamps.h"

/// @file
/// N-fold coincidence counting over time-tagged detections. A coincidence is
/// one detection per channel, all falling inside a trailing window of width
/// `coincWindowPs`: an earlier detection still counts when it is strictly less
/// than `coincWindowPs` older than the latest one.

/// Largest channel count the counters accept.
constexpr int kMaxChannels = 16;

/// Counts `channels`-fold coincidences in one interleaved, time-ordered event
/// stream. Multi-bit patterns are treated as simultaneous single-channel
/// detections in ascending channel order; pattern bits at or above `channels`
/// are ignored. Runs in O(N) with a sliding window.
long long countCoincidences(std::span<const Event> events,
                            Timestamp coincWindowPs,
                            int channels = kDefaultChannels);

/// Counts coincidences across `streams.size()` separately sorted channels
/// (stream k is channel k). The streams are merged on the fly through a
/// binary min-heap keyed by (time, channel), so equal timestamps are taken
/// lower channel first. Returns the same total as countCoincidences on the
/// interleaved stream.
long long
countCoincidencesMulti(const std::vector<std::span<const Timestamp>> &streams,
                       Timestamp coincWindowPs);
