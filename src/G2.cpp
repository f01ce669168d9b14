#include "G2.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

#include "Errors.h"

namespace {

void validateChannel(int channel, const char *role) {
    if (channel < 0 || channel >= kDefaultChannels)
        throw ConfigurationError(std::string("Selected ") + role +
                                 " channel not in range: " +
                                 std::to_string(channel));
}

} // namespace

std::vector<Timestamp> splitChannel(std::span<const Event> events, int channel) {
    const unsigned wanted = 1u << channel;
    std::vector<Timestamp> times;
    for (const Event &event : events) {
        if (event.pattern == wanted)
            times.push_back(event.time);
    }
    return times;
}

G2Result extractG2(std::span<const Event> events, const HistogramConfig &config,
                   int startChannel, int stopChannel, Timestamp stopDelayPs,
                   Timestamp minRangePs) {
    validateConfig(config);
    validateChannel(startChannel, "start");
    validateChannel(stopChannel, "stop");

    const std::vector<Timestamp> starts = splitChannel(events, startChannel);
    std::vector<Timestamp> stops = splitChannel(events, stopChannel);
    // A constant shift keeps the stops sorted.
    const Timestamp shift = stopDelayPs - minRangePs;
    for (Timestamp &t : stops)
        t += shift;

    G2Result result;
    result.histogram = pairwiseHistogram(starts, stops, config);
    result.startCount = starts.size();
    result.stopCount = stops.size();
    if (!events.empty())
        result.spanPs = events.back().time - events.front().time;

    result.timeAxisPs.resize(static_cast<size_t>(config.bins));
    for (size_t k = 0; k < result.timeAxisPs.size(); ++k)
        result.timeAxisPs[k] =
            minRangePs + static_cast<Timestamp>(k) * config.binWidthPs;
    return result;
}

HistogramPeak findPeak(const std::vector<long long> &histogram,
                       const HistogramConfig &config, Timestamp offsetPs) {
    validateConfig(config);
    HistogramPeak peak;
    if (histogram.empty())
        return peak;
    const auto it = std::max_element(histogram.begin(), histogram.end());
    peak.bin = static_cast<size_t>(it - histogram.begin());
    peak.counts = *it;
    peak.delayPs = offsetPs + static_cast<Timestamp>(peak.bin) * config.binWidthPs;
    return peak;
}

void writeHistogramsToFile(const std::vector<Timestamp> &timeAxisPs,
                           const std::vector<const std::vector<long long> *> &columns,
                           const std::string &header,
                           const std::string &filename) {
    for (const auto *column : columns) {
        if (column->size() != timeAxisPs.size())
            throw std::invalid_argument("histogram length must match time axis");
    }
    std::ofstream out(filename);
    if (!out.is_open())
        throw std::runtime_error("Error opening file: " + filename);
    out << header << "\n";
    for (size_t k = 0; k < timeAxisPs.size(); ++k) {
        out << timestampToNanoseconds(timeAxisPs[k]);
        for (const auto *column : columns)
            out << "," << (*column)[k];
        out << "\n";
    }
    if (!out)
        throw std::runtime_error("Failed writing " + filename);
}
