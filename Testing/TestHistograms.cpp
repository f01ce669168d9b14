#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "Errors.h"
#include "Histograms.h"

namespace {

constexpr Timestamp kNs = kPicosecondsPerNanosecond;

std::vector<Timestamp> nsList(std::initializer_list<Timestamp> ns) {
    std::vector<Timestamp> out;
    for (Timestamp v : ns)
        out.push_back(v * kNs);
    return out;
}

// Nearest stop at or after each start, found by a full scan.
std::vector<long long> naiveHistogram(const std::vector<Timestamp> &t1,
                                      const std::vector<Timestamp> &t2,
                                      const HistogramConfig &config) {
    std::vector<long long> hist(static_cast<size_t>(config.bins), 0);
    for (const Timestamp a : t1) {
        bool found = false;
        Timestamp best = 0;
        for (const Timestamp b : t2) {
            if (b >= a && (!found || b < best)) {
                best = b;
                found = true;
            }
        }
        if (found && best - a < config.rangePs())
            ++hist[static_cast<size_t>((best - a) / config.binWidthPs)];
    }
    return hist;
}

// Heralded histograms from a full scan per herald.
TripleHistogram naiveTriple(const std::vector<Timestamp> &t1,
                            const std::vector<Timestamp> &t2,
                            const std::vector<Timestamp> &t3,
                            const HistogramConfig &config) {
    const size_t bins = static_cast<size_t>(config.bins);
    TripleHistogram h{std::vector<long long>(bins, 0),
                      std::vector<long long>(bins, 0),
                      std::vector<long long>(bins, 0),
                      std::vector<long long>(bins, 0)};
    const Timestamp range = config.rangePs();
    auto nearest = [](const std::vector<Timestamp> &seq, Timestamp a,
                      Timestamp &out) {
        auto it = std::lower_bound(seq.begin(), seq.end(), a);
        if (it == seq.end())
            return false;
        out = *it;
        return true;
    };
    for (const Timestamp a : t1) {
        Timestamp b = 0;
        Timestamp c = 0;
        const bool hasB = nearest(t2, a, b) && b - a < range;
        const bool hasC = nearest(t3, a, c) && c - a < range;
        if (hasB)
            ++h.ba[static_cast<size_t>((b - a) / config.binWidthPs)];
        if (hasC)
            ++h.ca[static_cast<size_t>((c - a) / config.binWidthPs)];
        if (hasB && hasC && c >= b)
            ++h.cb[static_cast<size_t>((c - b) / config.binWidthPs)];
        if (hasB && hasC && b >= c)
            ++h.bc[static_cast<size_t>((b - c) / config.binWidthPs)];
    }
    return h;
}

std::vector<Timestamp> randomSorted(std::mt19937 &rng, size_t n, Timestamp maxValue) {
    std::uniform_int_distribution<Timestamp> dist(0, maxValue);
    std::vector<Timestamp> out(n);
    for (auto &v : out)
        v = dist(rng);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

void testStartStopExample() {
    const auto t1 = nsList({0, 10, 20});
    const auto t2 = nsList({5, 12, 50});
    const auto hist =
        pairwiseHistogram(t1, t2, HistogramConfig::fromNanoseconds(5, 2.0));
    const std::vector<long long> expected{0, 1, 1, 0, 0};
    assert(hist == expected);
}

void testMatchesNaiveOnRandomInputs() {
    std::mt19937 rng(12345);
    std::uniform_int_distribution<size_t> sizeDist(0, 200);
    for (int trial = 0; trial < 300; ++trial) {
        HistogramConfig config;
        config.bins = 1 + trial % 17;
        config.binWidthPs = 1 + trial % 5;
        // Small value ranges force plenty of duplicate timestamps.
        const Timestamp maxValue = (trial % 3 == 0) ? 20 : 400;
        const auto t1 = randomSorted(rng, sizeDist(rng), maxValue);
        const auto t2 = randomSorted(rng, sizeDist(rng), maxValue);
        assert(pairwiseHistogram(t1, t2, config) == naiveHistogram(t1, t2, config));
    }
}

void testAdversarialInputs() {
    HistogramConfig config;
    config.bins = 4;
    config.binWidthPs = 10;

    // All stops before all starts.
    std::vector<Timestamp> starts{100, 200, 300};
    std::vector<Timestamp> early{1, 2, 3};
    assert(pairwiseHistogram(starts, early, config) ==
           std::vector<long long>(4, 0));

    // Every start equal to every stop.
    std::vector<Timestamp> same(50, 7);
    auto hist = pairwiseHistogram(same, same, config);
    assert(hist[0] == 50);

    // One stop shared by many starts.
    std::vector<Timestamp> many{0, 1, 2, 3, 4};
    std::vector<Timestamp> single{5};
    hist = pairwiseHistogram(many, single, config);
    assert(hist[0] == 5);
    assert(hist == naiveHistogram(many, single, config));
}

void testEmptyInputs() {
    const std::vector<Timestamp> empty;
    const auto some = nsList({1, 2, 3});
    const HistogramConfig config = HistogramConfig::fromNanoseconds(8, 1.0);
    const std::vector<long long> zeros(8, 0);
    assert(pairwiseHistogram(empty, some, config) == zeros);
    assert(pairwiseHistogram(some, empty, config) == zeros);
    assert(pairwiseHistogram(empty, empty, config) == zeros);

    const MaskedHistogram masked = maskedPairwiseHistogram(some, empty, config);
    assert(masked.histogram == zeros);
    assert(masked.mask1.size() == 3 && masked.mask2.empty());

    const TripleHistogram triple = tripleConditionalHistogram(some, empty, some, config);
    assert(triple.ba == zeros && triple.cb == zeros && triple.bc == zeros);
    assert(triple.ca[0] == 3);
}

void testRangeBoundary() {
    HistogramConfig config;
    config.bins = 5;
    config.binWidthPs = 2000;
    const std::vector<Timestamp> start{0};

    const std::vector<Timestamp> atRange{config.rangePs()};
    assert(pairwiseHistogram(start, atRange, config) ==
           std::vector<long long>(5, 0));

    const std::vector<Timestamp> justInside{config.rangePs() - 1};
    const auto hist = pairwiseHistogram(start, justInside, config);
    assert(hist[4] == 1);
    assert(hist[0] + hist[1] + hist[2] + hist[3] == 0);
}

void testRepeatedCallsAgree() {
    std::mt19937 rng(7);
    const auto t1 = randomSorted(rng, 150, 10'000);
    const auto t2 = randomSorted(rng, 150, 10'000);
    HistogramConfig config;
    config.bins = 50;
    config.binWidthPs = 20;
    const auto first = pairwiseHistogram(t1, t2, config);
    const auto second = pairwiseHistogram(t1, t2, config);
    assert(first == second);
    const auto masked = maskedPairwiseHistogram(t1, t2, config);
    assert(masked.histogram == first);
}

void testMasksMarkPairedEvents() {
    const auto t1 = nsList({0, 10, 20});
    const auto t2 = nsList({5, 12, 50});
    const auto r =
        maskedPairwiseHistogram(t1, t2, HistogramConfig::fromNanoseconds(5, 2.0));
    assert((r.histogram == std::vector<long long>{0, 1, 1, 0, 0}));
    assert((r.mask1 == std::vector<bool>{true, true, false}));
    assert((r.mask2 == std::vector<bool>{true, true, false}));

    const auto kept = applyMask(t2, r.mask2);
    assert((kept == nsList({5, 12})));

    bool threw = false;
    try {
        (void)applyMask(t2, std::vector<bool>{true});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

void testMasksMatchNaive() {
    std::mt19937 rng(99);
    HistogramConfig config;
    config.bins = 10;
    config.binWidthPs = 3;
    for (int trial = 0; trial < 100; ++trial) {
        const auto t1 = randomSorted(rng, 60, 300);
        const auto t2 = randomSorted(rng, 60, 300);
        const auto r = maskedPairwiseHistogram(t1, t2, config);
        for (size_t i = 0; i < t1.size(); ++i) {
            auto it = std::lower_bound(t2.begin(), t2.end(), t1[i]);
            const bool paired = it != t2.end() && *it - t1[i] < config.rangePs();
            assert(r.mask1[i] == paired);
        }
        for (size_t j = 0; j < t2.size(); ++j) {
            if (!r.mask2[j])
                continue;
            // A marked stop is the nearest one for some start; for duplicate
            // stops only the first copy is ever chosen.
            assert(j == 0 || t2[j - 1] != t2[j]);
        }
    }
}

void testTripleOrderings() {
    HistogramConfig config;
    config.bins = 10;
    config.binWidthPs = 1000;
    // First herald: b then c. Second herald: c then b.
    const std::vector<Timestamp> t1{0, 100'000};
    const std::vector<Timestamp> t2{4'000, 107'000};
    const std::vector<Timestamp> t3{6'000, 103'000};

    const TripleHistogram h = tripleConditionalHistogram(t1, t2, t3, config);
    std::vector<long long> ba(10, 0), ca(10, 0), cb(10, 0), bc(10, 0);
    ba[4] = 1;
    ba[7] = 1;
    ca[6] = 1;
    ca[3] = 1;
    cb[2] = 1;
    bc[4] = 1;
    assert(h.ba == ba);
    assert(h.ca == ca);
    assert(h.cb == cb);
    assert(h.bc == bc);
}

void testTripleMatchesNaive() {
    std::mt19937 rng(2024);
    std::uniform_int_distribution<size_t> sizeDist(0, 120);
    for (int trial = 0; trial < 200; ++trial) {
        HistogramConfig config;
        config.bins = 1 + trial % 13;
        config.binWidthPs = 1 + trial % 4;
        const Timestamp maxValue = (trial % 2 == 0) ? 30 : 500;
        const auto t1 = randomSorted(rng, sizeDist(rng), maxValue);
        const auto t2 = randomSorted(rng, sizeDist(rng), maxValue);
        const auto t3 = randomSorted(rng, sizeDist(rng), maxValue);
        const TripleHistogram fast = tripleConditionalHistogram(t1, t2, t3, config);
        const TripleHistogram slow = naiveTriple(t1, t2, t3, config);
        assert(fast.ba == slow.ba);
        assert(fast.ca == slow.ca);
        assert(fast.cb == slow.cb);
        assert(fast.bc == slow.bc);
        // Pass A's herald histogram is the plain start/stop histogram.
        assert(fast.ba == pairwiseHistogram(t1, t2, config));
        assert(fast.ca == pairwiseHistogram(t1, t3, config));
    }
}

void testPartitionedMatchesSequential() {
    std::mt19937 rng(31337);
    HistogramConfig config;
    config.bins = 64;
    config.binWidthPs = 5;
    for (int parts : {0, 1, 2, 3, 7, 1000}) {
        const auto t1 = randomSorted(rng, 997, 50'000);
        const auto t2 = randomSorted(rng, 1'003, 50'000);
        assert(pairwiseHistogramPartitioned(t1, t2, config, parts) ==
               pairwiseHistogram(t1, t2, config));
    }
    const std::vector<Timestamp> empty;
    const auto some = randomSorted(rng, 10, 100);
    assert(pairwiseHistogramPartitioned(empty, some, config, 4) ==
           std::vector<long long>(64, 0));
}

void testInvalidConfigurationThrows() {
    const auto t = nsList({1, 2});
    auto expectThrow = [&](const HistogramConfig &config) {
        bool threw = false;
        try {
            (void)pairwiseHistogram(t, t, config);
        } catch (const ConfigurationError &) {
            threw = true;
        }
        assert(threw);
    };
    HistogramConfig zeroBins;
    zeroBins.bins = 0;
    expectThrow(zeroBins);
    HistogramConfig negativeBins;
    negativeBins.bins = -3;
    expectThrow(negativeBins);
    expectThrow(HistogramConfig::fromNanoseconds(10, 0.0));
    expectThrow(HistogramConfig::fromNanoseconds(10, -2.0));
    // Below the picosecond grid once rounded.
    expectThrow(HistogramConfig::fromNanoseconds(10, 0.0001));

    bool threw = false;
    try {
        (void)tripleConditionalHistogram(t, t, t, zeroBins);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

void testOrderingCheck() {
    const std::vector<Timestamp> unsorted{10, 20, 15, 30};
    bool threw = false;
    try {
        checkAscending(unsorted, "t1");
    } catch (const PreconditionViolation &ex) {
        threw = true;
        const std::string message = ex.what();
        assert(message.find("t1") != std::string::npos);
        assert(message.find("index 2") != std::string::npos);
    }
    assert(threw);

    // Duplicates are allowed.
    const std::vector<Timestamp> withTies{0, 5, 5, 5, 9};
    checkAscending(withTies, "t2");
    checkAscending(std::vector<Timestamp>{}, "empty");

    const std::vector<Event> events{{0, 1}, {7, 2}, {7, 4}, {3, 8}};
    threw = false;
    try {
        checkAscending(events, "events");
    } catch (const PreconditionViolation &ex) {
        threw = true;
        assert(std::string(ex.what()).find("index 3") != std::string::npos);
    }
    assert(threw);
    checkAscending(std::span<const Event>(events.data(), 3), "events");
}

int main() {
    testStartStopExample();
    testMatchesNaiveOnRandomInputs();
    testAdversarialInputs();
    testEmptyInputs();
    testRangeBoundary();
    testRepeatedCallsAgree();
    testMasksMarkPairedEvents();
    testMasksMatchNaive();
    testTripleOrderings();
    testTripleMatchesNaive();
    testPartitionedMatchesSequential();
    testInvalidConfigurationThrows();
    testOrderingCheck();
    std::cout << "All histogram tests passed" << std::endl;
    return 0;
}
