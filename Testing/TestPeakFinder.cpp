#include <algorithm>
#include <cassert>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

#include "Errors.h"
#include "PeakFinder.h"

namespace {

constexpr Timestamp kResolution = 1'000;

// Sorted random times spread over several buffer lengths, so folding wraps.
std::vector<Timestamp> randomTimes(std::mt19937 &rng, size_t count,
                                   Timestamp start, Timestamp span) {
    std::uniform_int_distribution<Timestamp> dist(start, start + span);
    std::vector<Timestamp> times(count);
    for (auto &t : times)
        t = dist(rng);
    std::sort(times.begin(), times.end());
    return times;
}

std::vector<Timestamp> shiftedBy(std::vector<Timestamp> times, Timestamp shift) {
    for (auto &t : times)
        t += shift;
    return times;
}

} // namespace

void testRecoversKnownDelay() {
    std::mt19937 rng(7);
    const int log2n = 12;
    const Timestamp bufferPs = (Timestamp{1} << log2n) * kResolution;
    const auto t1 = randomTimes(rng, 300, 0, 3 * bufferPs);
    const auto t2 = shiftedBy(t1, 37 * kResolution);

    const PeakFinderResult r = peakFinder(t1, t2, kResolution, log2n);
    assert(r.delayPs == 37 * kResolution);
    assert(r.correlation.size() == (size_t{1} << log2n));
    assert(r.timeAxisPs.size() == r.correlation.size());
    assert(r.timeAxisPs[1] == kResolution);
    assert(r.timeAxisPs.back() == bufferPs - kResolution);

    // Every shifted copy lands exactly 37 samples later: the peak holds the
    // sum of squared sample counts, and the whole correlation all pairs.
    assert(r.correlation[37] >= static_cast<long long>(t1.size()));
    const long long total =
        std::accumulate(r.correlation.begin(), r.correlation.end(), 0LL);
    assert(total == static_cast<long long>(t1.size() * t2.size()));
}

void testNegativeDelayWraps() {
    std::mt19937 rng(11);
    const int log2n = 10;
    const auto t1 = randomTimes(rng, 200, 100 * kResolution, 5'000 * kResolution);
    const auto t2 = shiftedBy(t1, -5 * kResolution);

    const PeakFinderResult r = peakFinder(t1, t2, kResolution, log2n);
    assert(r.delayPs == ((Timestamp{1} << log2n) - 5) * kResolution);
}

void testDelayWithBackground() {
    std::mt19937 rng(3);
    const int log2n = 11;
    const auto t1 = randomTimes(rng, 400, 0, 50'000 * kResolution);
    std::vector<Timestamp> t2 = shiftedBy(t1, 250 * kResolution);
    const auto noise = randomTimes(rng, 400, 0, 50'000 * kResolution);
    t2.insert(t2.end(), noise.begin(), noise.end());
    std::sort(t2.begin(), t2.end());

    const PeakFinderResult r = peakFinder(t1, t2, kResolution, log2n);
    assert(r.delayPs == 250 * kResolution);
}

void testEmptyInputs() {
    const std::vector<Timestamp> none;
    const std::vector<Timestamp> some{1'000, 2'000};
    const PeakFinderResult r = peakFinder(none, some, kResolution, 4);
    assert(r.correlation.size() == 16);
    assert(std::all_of(r.correlation.begin(), r.correlation.end(),
                       [](long long c) { return c == 0; }));
    assert(r.delayPs == 0);
}

void testInvalidConfigurationThrows() {
    const std::vector<Timestamp> t{0, 1'000};
    auto expectThrow = [&](Timestamp resolution, int log2n) {
        bool threw = false;
        try {
            (void)peakFinder(t, t, resolution, log2n);
        } catch (const ConfigurationError &) {
            threw = true;
        }
        assert(threw);
    };
    expectThrow(0, 8);
    expectThrow(-1'000, 8);
    expectThrow(kResolution, 0);
    expectThrow(kResolution, kMaxPeakFinderBufferLog2 + 1);
}

int main() {
    testRecoversKnownDelay();
    testNegativeDelayWraps();
    testDelayWithBackground();
    testEmptyInputs();
    testInvalidConfigurationThrows();
    std::cout << "All peak finder tests passed" << std::endl;
    return 0;
}
