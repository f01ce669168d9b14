#include "Coincidences.h"

// Sliding-window coincidence counting. The window keeps a FIFO of the events
// that are still inside it and, per channel, how many of those events hit that
// channel. When a detection on channel i arrives, every combination of one
// active detection on each other channel forms a new coincidence with it, so
// the number of new coincidences is the product of the other channels'
// active counts.

#include <algorithm>
#include <deque>
#include <string>

#include "Errors.h"

namespace {

class CoincidenceWindow {
public:
    CoincidenceWindow(int channels, Timestamp widthPs)
        : active_(static_cast<size_t>(channels), 0), widthPs_(widthPs),
          channelMask_((1u << channels) - 1u) {}

    /// Adds one event and returns the number of coincidences it completes.
    long long add(const Event &event) {
        evictOlderThan(event.time);

        const unsigned pattern = event.pattern & channelMask_;
        long long formed = 0;
        for (size_t ch = 0; ch < active_.size(); ++ch) {
            if ((pattern & (1u << ch)) == 0)
                continue;
            formed += productExcept(ch);
            ++active_[ch];
        }
        if (pattern != 0)
            queue_.push_back({event.time, pattern});
        return formed;
    }

private:
    // Events exactly widthPs_ old are already outside (t - width, t].
    void evictOlderThan(Timestamp now) {
        const Timestamp cutoff = now - widthPs_;
        while (!queue_.empty() && queue_.front().time <= cutoff) {
            const unsigned pattern = queue_.front().pattern;
            for (size_t ch = 0; ch < active_.size(); ++ch) {
                if (pattern & (1u << ch))
                    --active_[ch];
            }
            queue_.pop_front();
        }
    }

    long long productExcept(size_t skip) const {
        long long product = 1;
        for (size_t ch = 0; ch < active_.size(); ++ch) {
            if (ch == skip)
                continue;
            if (active_[ch] == 0)
                return 0;
            product *= active_[ch];
        }
        return product;
    }

    std::deque<Event> queue_;
    std::vector<long long> active_;
    Timestamp widthPs_;
    unsigned channelMask_;
};

void validateWindow(Timestamp coincWindowPs, int channels) {
    if (coincWindowPs <= 0)
        throw ConfigurationError("coincidence window must be positive in ps");
    if (channels < 1 || channels > kMaxChannels)
        throw ConfigurationError("channel count must be in [1, " +
                                 std::to_string(kMaxChannels) + "], got " +
                                 std::to_string(channels));
}

struct HeapEntry {
    Timestamp time;
    size_t channel;
    size_t index; // position of `time` inside its stream
};

// std::*_heap build max-heaps; inverting the order yields a min-heap on
// (time, channel).
struct LaterEntry {
    bool operator()(const HeapEntry &a, const HeapEntry &b) const {
        if (a.time != b.time)
            return a.time > b.time;
        return a.channel > b.channel;
    }
};

} // namespace

long long countCoincidences(std::span<const Event> events,
                            Timestamp coincWindowPs, int channels) {
    validateWindow(coincWindowPs, channels);
    debugCheckAscending(events, "events");

    CoincidenceWindow window(channels, coincWindowPs);
    long long total = 0;
    for (const Event &event : events)
        total += window.add(event);
    return total;
}

long long
countCoincidencesMulti(const std::vector<std::span<const Timestamp>> &streams,
                       Timestamp coincWindowPs) {
    const int channels = static_cast<int>(streams.size());
    validateWindow(coincWindowPs, channels);
    for (const auto &stream : streams)
        debugCheckAscending(stream, "stream");

    std::vector<HeapEntry> heap;
    heap.reserve(streams.size());
    for (size_t ch = 0; ch < streams.size(); ++ch) {
        if (!streams[ch].empty())
            heap.push_back({streams[ch].front(), ch, 0});
    }
    std::make_heap(heap.begin(), heap.end(), LaterEntry{});

    CoincidenceWindow window(channels, coincWindowPs);
    long long total = 0;
    while (!heap.empty()) {
        std::pop_heap(heap.begin(), heap.end(), LaterEntry{});
        const HeapEntry next = heap.back();
        heap.pop_back();

        const auto &stream = streams[next.channel];
        if (next.index + 1 < stream.size()) {
            heap.push_back({stream[next.index + 1], next.channel, next.index + 1});
            std::push_heap(heap.begin(), heap.end(), LaterEntry{});
        }

        total += window.add({next.time, 1u << next.channel});
    }
    return total;
}
