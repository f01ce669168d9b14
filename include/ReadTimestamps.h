#pragma once
#include <span>
#include <string>
#include <vector>

#include "Timestamps.h"

/// @file
/// Readers and writers for the raw event files produced by the timestamp unit.
/// Each event is a 64-bit word: the upper 54 bits count 1/256 ns ticks, bit 4
/// is the rollover flag and bits 0-3 are the channel pattern. Decoded times are
/// rounded onto the picosecond grid used by the rest of the library.
///
///  - a0: text, one 8-digit hex 32-bit word per line, low word first.
///  - a1: binary, native-endian pairs of 32-bit words, low word first
///        (high word first in legacy files).
///  - a2: text, one 16-digit hex event per line.
///
/// Older timestamp cards write a1 records with 1/8 ns resolution instead:
/// the time is (high << 17) + (low >> 15) in 125 ps ticks, the pattern still
/// sits in bits 0-3 of the low word.

enum class TimestampFormat { A0, A1, A2 };

/// Parses "a0", "a1" or "a2" (also "0", "1", "2"). Throws std::invalid_argument
/// otherwise.
TimestampFormat parseTimestampFormat(const std::string &name);

/// Returns true if `str` ends with the requested suffix.
bool hasEnding(const std::string &str, const std::string &ending);

/// Raw tick (1/256 ns) <-> picosecond conversions.
Timestamp rawTicksToTimestamp(unsigned long long ticks);
unsigned long long timestampToRawTicks(Timestamp ps);

std::vector<Event> readA0(const std::string &filename);

/// @param legacy Word order of files written by older firmware (high word
///        first).
/// @param ignoreRollover Drop records whose rollover flag is set.
/// @param highres 1/256 ns card layout; false decodes the 1/8 ns layout.
std::vector<Event> readA1(const std::string &filename, bool legacy = false,
                          bool ignoreRollover = true, bool highres = true);

std::vector<Event> readA2(const std::string &filename);

/// Reads `filename` in the given format.
std::vector<Event> readTimestamps(const std::string &filename,
                                  TimestampFormat format, bool legacy = false);

/// Picks the format from the suffix (".a0", ".a2", anything else is a1).
std::vector<Event> readTimestampsAuto(const std::string &filename,
                                      bool legacy = false);

/// Raw 64-bit records, high word in the upper half, exactly as stored (no
/// rollover filtering, no decoding).
std::vector<unsigned long long> readRawWords(const std::string &filename,
                                             TimestampFormat format,
                                             bool legacy = false);

/// Writers sort the events before encoding. Patterns are masked to 4 bits.
void writeA0(const std::string &filename, std::span<const Event> events);
void writeA1(const std::string &filename, std::span<const Event> events,
             bool legacy = false);
void writeA2(const std::string &filename, std::span<const Event> events);

/// Writes `events` in the given format; `legacy` only affects a1.
void writeTimestamps(const std::string &filename, std::span<const Event> events,
                     TimestampFormat format, bool legacy = false);
