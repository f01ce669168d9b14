// G2Hist CLI driver. Reads a raw timestamp file, builds the start/stop g2
// histogram between two channels, reports its peak and counts 4-fold
// coincidences across all input channels.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "Coincidences.h"
#include "G2.h"
#include "ReadTimestamps.h"

namespace {

void print_help(const char *exe) {
  std::cout
      << "G2Hist - start/stop histogram and 4-fold coincidences\n"
      << "Usage: " << exe
      << " <timestamp_file> <start_ch> <stop_ch> <bins> <bin_width_ns> "
         "<stop_delay_ns> <coinc_window_ns> [output_csv] [--legacy]\n"
      << "Examples:\n"
      << "  " << exe << " run.a1 0 1 500 2 0 4\n"
      << "  " << exe << " run.a2 0 3 40 2 2 4 g2.csv\n"
      << "Notes:\n"
      << "  - Channels are 0-based (0..3). Format follows the suffix "
         "(.a0, .a2, otherwise a1).\n"
      << "  - --legacy reads a1 files with swapped word order.\n";
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 8) {
    print_help(argv[0]);
    return 1;
  }

  const std::string filename = argv[1];
  const int startCh = std::atoi(argv[2]);
  const int stopCh = std::atoi(argv[3]);
  const int bins = std::atoi(argv[4]);
  const double binWidthNs = std::atof(argv[5]);
  const double stopDelayNs = std::atof(argv[6]);
  const double coincWindowNs = std::atof(argv[7]);
  const bool legacy = std::string(argv[argc - 1]) == "--legacy";
  const int positional = legacy ? argc - 1 : argc;
  const std::string outCsv = positional >= 9 ? argv[8] : "g2_histogram.csv";

  if (bins <= 0) {
    std::cerr << "bins must be positive.\n";
    return 1;
  }
  if (binWidthNs <= 0.0 || coincWindowNs <= 0.0) {
    std::cerr << "bin_width and coinc_window must be positive.\n";
    return 1;
  }

  // Convert once up front so the rest of the pipeline stays in integers.
  const HistogramConfig config = HistogramConfig::fromNanoseconds(bins, binWidthNs);
  const Timestamp stopDelayPs = nanosecondsToTimestamp(stopDelayNs);
  const Timestamp coincWindowPs = nanosecondsToTimestamp(coincWindowNs);
  if (config.binWidthPs <= 0 || coincWindowPs <= 0) {
    std::cerr << "bin_width/coinc_window too small once converted to "
                 "picoseconds.\n";
    return 1;
  }

  try {
    std::cout << "Reading " << filename << "...\n";
    const std::vector<Event> events = readTimestampsAuto(filename, legacy);
    if (events.empty()) {
      std::cerr << "No events found.\n";
      return 1;
    }
    std::cout << "Events: " << events.size() << ", span "
              << timestampToNanoseconds(events.back().time - events.front().time)
              << " ns\n";

    const G2Result g2 =
        extractG2(events, config, startCh, stopCh, stopDelayPs);
    std::cout << "Channel " << startCh << ": " << g2.startCount
              << " events, channel " << stopCh << ": " << g2.stopCount
              << " events\n";

    const HistogramPeak peak = findPeak(g2.histogram, config);
    std::cout << "Peak: " << peak.counts << " counts at "
              << timestampToNanoseconds(peak.delayPs) << " ns\n";

    writeHistogramsToFile(g2.timeAxisPs, {&g2.histogram}, "dt_ns,counts",
                          outCsv);
    std::cout << "Wrote histogram to " << outCsv << "\n";

    const long long fourFold =
        countCoincidences(events, coincWindowPs, kDefaultChannels);
    std::cout << "4-fold coincidences within " << coincWindowNs
              << " ns: " << fourFold << "\n";
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }
  return 0;
}
