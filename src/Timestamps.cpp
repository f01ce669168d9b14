#include "Timestamps.h"

#include <string>

#include "Errors.h"

std::vector<Timestamp> nanosecondsToTimestamps(std::span<const double> ns) {
    std::vector<Timestamp> out;
    out.reserve(ns.size());
    for (const double value : ns)
        out.push_back(nanosecondsToTimestamp(value));
    return out;
}

void checkAscending(std::span<const Timestamp> times, const char *name) {
    for (size_t i = 1; i < times.size(); ++i) {
        if (times[i] < times[i - 1])
            throw PreconditionViolation(std::string(name) +
                                        " is not sorted ascending at index " +
                                        std::to_string(i));
    }
}

void checkAscending(std::span<const Event> events, const char *name) {
    for (size_t i = 1; i < events.size(); ++i) {
        if (events[i].time < events[i - 1].time)
            throw PreconditionViolation(std::string(name) +
                                        " is not sorted ascending at index " +
                                        std::to_string(i));
    }
}
