// CondG2 CLI driver.
// Heralded g2: channel `herald` triggers, the two signal channels are
// histogrammed against it and against each other in both orders. With
// --masked the signal channels are first reduced to the events that pair with
// a herald, which removes uncorrelated background from the conditional
// histograms.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "G2.h"
#include "Histograms.h"
#include "ReadTimestamps.h"

namespace {

void print_help(const char *exe) {
    std::cout
        << "CondG2 - heralded (conditional) g2 histograms\n"
        << "Usage: " << exe
        << " <timestamp_file> <herald_ch> <signal_ch_b> <signal_ch_c> <bins> "
           "<bin_width_ns> <delay_b_ns> <delay_c_ns> [output_csv] [--masked] "
           "[--legacy]\n"
        << "Examples:\n"
        << "  " << exe << " run.a1 0 1 2 51 2 -21 -1\n"
        << "  " << exe << " run.a1 0 1 2 51 2 -21 -1 cond.csv --masked --legacy\n"
        << "Behavior:\n"
        << "  - delay_* are added to the signal channel timestamps.\n"
        << "  - --legacy reads a1 files with swapped word order.\n"
        << "  - Writes dt_ns,h_ba,h_ca,h_cb,h_bc to output_csv "
           "(default cond_g2.csv).\n";
}

std::vector<Timestamp> shifted(std::vector<Timestamp> times, Timestamp delayPs) {
    for (Timestamp &t : times)
        t += delayPs;
    return times;
}

} // namespace

int main(int argc, char *argv[]) {
    bool masked = false;
    bool legacy = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--masked")
            masked = true;
        else if (arg == "--legacy")
            legacy = true;
        else
            args.push_back(arg);
    }
    if (args.size() < 8) {
        print_help(argv[0]);
        return 1;
    }

    const std::string filename = args[0];
    const int heraldCh = std::atoi(args[1].c_str());
    const int chB = std::atoi(args[2].c_str());
    const int chC = std::atoi(args[3].c_str());
    const int bins = std::atoi(args[4].c_str());
    const double binWidthNs = std::atof(args[5].c_str());
    const double delayBNs = std::atof(args[6].c_str());
    const double delayCNs = std::atof(args[7].c_str());
    const std::string outCsv = args.size() >= 9 ? args[8] : "cond_g2.csv";

    for (int ch : {heraldCh, chB, chC}) {
        if (ch < 0 || ch >= kDefaultChannels) {
            std::cerr << "Channels must be in 0.." << kDefaultChannels - 1
                      << ".\n";
            return 1;
        }
    }
    if (bins <= 0 || binWidthNs <= 0.0) {
        std::cerr << "Invalid arguments.\n";
        return 1;
    }

    const HistogramConfig config =
        HistogramConfig::fromNanoseconds(bins, binWidthNs);

    try {
        std::cout << "Reading " << filename << "...\n";
        const std::vector<Event> events = readTimestampsAuto(filename, legacy);

        const std::vector<Timestamp> herald = splitChannel(events, heraldCh);
        std::vector<Timestamp> tb =
            shifted(splitChannel(events, chB), nanosecondsToTimestamp(delayBNs));
        std::vector<Timestamp> tc =
            shifted(splitChannel(events, chC), nanosecondsToTimestamp(delayCNs));
        std::cout << "Herald " << herald.size() << ", b " << tb.size() << ", c "
                  << tc.size() << " events\n";

        if (masked) {
            const MaskedHistogram mb = maskedPairwiseHistogram(herald, tb, config);
            const MaskedHistogram mc = maskedPairwiseHistogram(herald, tc, config);
            tb = applyMask(tb, mb.mask2);
            tc = applyMask(tc, mc.mask2);
            std::cout << "Kept " << tb.size() << " b and " << tc.size()
                      << " c events paired with a herald\n";
        }

        const TripleHistogram h =
            tripleConditionalHistogram(herald, tb, tc, config);

        std::vector<Timestamp> axis(static_cast<size_t>(bins));
        for (size_t k = 0; k < axis.size(); ++k)
            axis[k] = static_cast<Timestamp>(k) * config.binWidthPs;
        writeHistogramsToFile(axis, {&h.ba, &h.ca, &h.cb, &h.bc},
                              "dt_ns,h_ba,h_ca,h_cb,h_bc", outCsv);

        const HistogramPeak pb = findPeak(h.ba, config);
        const HistogramPeak pc = findPeak(h.ca, config);
        std::cout << "Peak b-a at " << timestampToNanoseconds(pb.delayPs)
                  << " ns, c-a at " << timestampToNanoseconds(pc.delayPs)
                  << " ns\n";
        std::cout << "Wrote conditional histograms to " << outCsv << "\n";
    } catch (const std::exception &ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    }
    return 0;
}
