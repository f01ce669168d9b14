#pragma once
#include <cmath>
#include <cstdint>
#include <span>
#include <vector>

/// @file
/// Basic time-tag types shared by the histogram and coincidence modules, the
/// raw file readers and the Python bindings. Every time value inside the
/// library is an integer number of picoseconds; floating-point nanoseconds
/// only appear at the boundary (CLI arguments, Python inputs).

/// Detector timestamp in picoseconds.
using Timestamp = long long;

/// One detection: a timestamp plus the bitmask of channels that fired.
struct Event {
    Timestamp time = 0;
    /// Bit i set => channel i (0-based) fired at `time`.
    unsigned pattern = 0;
};

inline bool operator==(const Event &a, const Event &b) {
    return a.time == b.time && a.pattern == b.pattern;
}

constexpr long long kPicosecondsPerNanosecond = 1000LL;

/// Number of input channels on the timestamp unit.
constexpr int kDefaultChannels = 4;

/// Rounds a nanosecond value onto the picosecond grid.
inline Timestamp nanosecondsToTimestamp(double ns) {
    return static_cast<Timestamp>(
        std::llround(ns * static_cast<double>(kPicosecondsPerNanosecond)));
}

inline double timestampToNanoseconds(Timestamp ps) {
    return static_cast<double>(ps) / kPicosecondsPerNanosecond;
}

/// Converts a whole nanosecond sequence (e.g. a numpy array handed over from
/// Python) into picosecond timestamps.
std::vector<Timestamp> nanosecondsToTimestamps(std::span<const double> ns);

/// Throws PreconditionViolation when `times` is not non-decreasing. `name`
/// is used in the message.
void checkAscending(std::span<const Timestamp> times, const char *name);
void checkAscending(std::span<const Event> events, const char *name);

/// Runs `checkAscending` only in builds configured with
/// G2FINDER_CHECK_ORDERING; otherwise the call is free.
template <typename Seq>
inline void debugCheckAscending([[maybe_unused]] const Seq &seq,
                                [[maybe_unused]] const char *name) {
#ifdef G2FINDER_CHECK_ORDERING
    checkAscending(seq, name);
#endif
}
