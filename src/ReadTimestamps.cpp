#include "ReadTimestamps.h"

// Raw event decoding. Records are turned into `Event`s in file order; the
// timestamp unit already emits them sorted, so no reordering happens on read.

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace {

constexpr unsigned kPatternMask = 0xF;
constexpr uint32_t kRolloverFlag = 0x10;
constexpr int kTickShift = 10;
constexpr int kHighShift = 22;
constexpr int kLowResTickShift = 15;
constexpr int kLowResHighShift = 17;
constexpr Timestamp kLowResTickPs = 125;

inline Event decodeWords(uint32_t low, uint32_t high) {
    const unsigned long long ticks =
        (static_cast<unsigned long long>(high) << kHighShift) + (low >> kTickShift);
    return {rawTicksToTimestamp(ticks), low & kPatternMask};
}

// 1/8 ns card: 125 ps ticks, no rounding needed.
inline Event decodeLowResWords(uint32_t low, uint32_t high) {
    const unsigned long long ticks =
        (static_cast<unsigned long long>(high) << kLowResHighShift) +
        (low >> kLowResTickShift);
    return {static_cast<Timestamp>(ticks) * kLowResTickPs, low & kPatternMask};
}

inline unsigned long long joinWords(uint32_t low, uint32_t high) {
    return (static_cast<unsigned long long>(high) << 32) | low;
}

inline unsigned long long encodeEvent(const Event &event) {
    return (timestampToRawTicks(event.time) << kTickShift) |
           (event.pattern & kPatternMask);
}

template <typename T>
bool parseHex(std::string_view token, T &value) {
    const char *begin = token.data();
    const char *end = begin + token.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(*begin)))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1))))
        --end;
    if (begin == end)
        return false;
    auto result = std::from_chars(begin, end, value, 16);
    return result.ec == std::errc() && result.ptr == end;
}

bool isBlank(const std::string &line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

// Reads one hex value per non-blank line.
template <typename T>
std::vector<T> readHexLines(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Cannot open timestamp file: " + filename);

    std::vector<T> values;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (isBlank(line))
            continue;
        T value = 0;
        if (!parseHex(line, value))
            throw std::runtime_error("Malformed hex value in " + filename +
                                     " line " + std::to_string(lineNo));
        values.push_back(value);
    }
    return values;
}

std::vector<Event> sortedCopy(std::span<const Event> events) {
    std::vector<Event> sorted(events.begin(), events.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Event &a, const Event &b) { return a.time < b.time; });
    return sorted;
}

std::ofstream openForWriting(const std::string &filename, bool binary) {
    std::ofstream out(filename, binary ? std::ios::binary : std::ios::out);
    if (!out.is_open())
        throw std::runtime_error("Cannot open output file: " + filename);
    return out;
}

void writeHex(std::ofstream &out, unsigned long long value, int digits) {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%0*llx", digits, value);
    out << buffer << "\n";
}

} // namespace

bool hasEnding(const std::string &str, const std::string &ending) {
    return str.size() >= ending.size() &&
           str.compare(str.size() - ending.size(), ending.size(), ending) == 0;
}

TimestampFormat parseTimestampFormat(const std::string &name) {
    if (name == "a0" || name == "0")
        return TimestampFormat::A0;
    if (name == "a1" || name == "1")
        return TimestampFormat::A1;
    if (name == "a2" || name == "2")
        return TimestampFormat::A2;
    throw std::invalid_argument("Unknown timestamp format: " + name);
}

// 1 tick = 1/256 ns = 125/32 ps.
Timestamp rawTicksToTimestamp(unsigned long long ticks) {
    return static_cast<Timestamp>((ticks * 125ULL + 16ULL) / 32ULL);
}

unsigned long long timestampToRawTicks(Timestamp ps) {
    if (ps <= 0)
        return 0;
    return (static_cast<unsigned long long>(ps) * 32ULL + 62ULL) / 125ULL;
}

std::vector<Event> readA0(const std::string &filename) {
    const auto records = readRawWords(filename, TimestampFormat::A0);
    std::vector<Event> events;
    events.reserve(records.size());
    for (const unsigned long long record : records)
        events.push_back(decodeWords(static_cast<uint32_t>(record),
                                     static_cast<uint32_t>(record >> 32)));
    return events;
}

namespace {

// Calls `onRecord(low, high)` for every a1 record in file order.
template <typename F>
void forEachA1Record(const std::string &filename, bool legacy, F &&onRecord) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Cannot open timestamp file: " + filename);

    uint32_t words[2] = {0, 0};
    const size_t lowPos = legacy ? 1 : 0;
    const size_t highPos = 1 - lowPos;
    while (file.read(reinterpret_cast<char *>(words), sizeof(words)))
        onRecord(words[lowPos], words[highPos]);
    if (file.gcount() != 0)
        throw std::runtime_error("Truncated record at end of a1 file: " +
                                 filename);
}

} // namespace

std::vector<Event> readA1(const std::string &filename, bool legacy,
                          bool ignoreRollover, bool highres) {
    std::vector<Event> events;
    forEachA1Record(filename, legacy, [&](uint32_t low, uint32_t high) {
        if (ignoreRollover && (low & kRolloverFlag))
            return;
        events.push_back(highres ? decodeWords(low, high)
                                 : decodeLowResWords(low, high));
    });
    return events;
}

std::vector<Event> readA2(const std::string &filename) {
    const auto values = readHexLines<unsigned long long>(filename);
    std::vector<Event> events;
    events.reserve(values.size());
    for (const unsigned long long value : values) {
        events.push_back({rawTicksToTimestamp(value >> kTickShift),
                          static_cast<unsigned>(value) & kPatternMask});
    }
    return events;
}

std::vector<Event> readTimestamps(const std::string &filename,
                                  TimestampFormat format, bool legacy) {
    switch (format) {
    case TimestampFormat::A0:
        return readA0(filename);
    case TimestampFormat::A2:
        return readA2(filename);
    case TimestampFormat::A1:
        break;
    }
    return readA1(filename, legacy);
}

std::vector<unsigned long long> readRawWords(const std::string &filename,
                                             TimestampFormat format,
                                             bool legacy) {
    std::vector<unsigned long long> records;
    switch (format) {
    case TimestampFormat::A0: {
        const auto words = readHexLines<uint32_t>(filename);
        if (words.size() % 2 != 0)
            throw std::runtime_error("Odd number of words in a0 file: " +
                                     filename);
        records.reserve(words.size() / 2);
        for (size_t i = 0; i < words.size(); i += 2)
            records.push_back(joinWords(words[i], words[i + 1]));
        break;
    }
    case TimestampFormat::A1:
        forEachA1Record(filename, legacy, [&](uint32_t low, uint32_t high) {
            records.push_back(joinWords(low, high));
        });
        break;
    case TimestampFormat::A2:
        records = readHexLines<unsigned long long>(filename);
        break;
    }
    return records;
}

std::vector<Event> readTimestampsAuto(const std::string &filename, bool legacy) {
    if (hasEnding(filename, ".a0"))
        return readA0(filename);
    if (hasEnding(filename, ".a2"))
        return readA2(filename);
    return readA1(filename, legacy);
}

void writeA0(const std::string &filename, std::span<const Event> events) {
    auto out = openForWriting(filename, false);
    for (const Event &event : sortedCopy(events)) {
        const unsigned long long word = encodeEvent(event);
        writeHex(out, word & 0xFFFFFFFFULL, 8);
        writeHex(out, word >> 32, 8);
    }
}

void writeA1(const std::string &filename, std::span<const Event> events,
             bool legacy) {
    auto out = openForWriting(filename, true);
    for (const Event &event : sortedCopy(events)) {
        const unsigned long long word = encodeEvent(event);
        uint32_t words[2];
        words[legacy ? 1 : 0] = static_cast<uint32_t>(word & 0xFFFFFFFFULL);
        words[legacy ? 0 : 1] = static_cast<uint32_t>(word >> 32);
        out.write(reinterpret_cast<const char *>(words), sizeof(words));
    }
    if (!out)
        throw std::runtime_error("Failed writing a1 file: " + filename);
}

void writeA2(const std::string &filename, std::span<const Event> events) {
    auto out = openForWriting(filename, false);
    for (const Event &event : sortedCopy(events))
        writeHex(out, encodeEvent(event), 16);
}

void writeTimestamps(const std::string &filename, std::span<const Event> events,
                     TimestampFormat format, bool legacy) {
    switch (format) {
    case TimestampFormat::A0:
        writeA0(filename, events);
        return;
    case TimestampFormat::A1:
        writeA1(filename, events, legacy);
        return;
    case TimestampFormat::A2:
        writeA2(filename, events);
        return;
    }
}
