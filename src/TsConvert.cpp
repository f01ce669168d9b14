// TsConvert CLI driver. Converts raw timestamp files between the a0, a1 and
// a2 formats, or dumps their records as 64-bit binary words.

#include <bitset>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "ReadTimestamps.h"

namespace {

void print_help(const char *exe) {
  std::cout
      << "TsConvert - convert between timestamp file formats\n"
      << "Usage: " << exe << " -A <0|1|2> [-X] -a <0|1|2> [-x] <infile> <outfile>\n"
      << "       " << exe << " -A <0|1|2> [-X] -b <infile>\n"
      << "Examples:\n"
      << "  " << exe << " -A 1 -X -a 2 run.a1 run.a2\n"
      << "  " << exe << " -A 1 -b run.a1\n"
      << "Options:\n"
      << "  -A / -a  input / output format (0: hex words, 1: binary, 2: hex "
         "events)\n"
      << "  -X / -x  input / output a1 files use the legacy word order\n"
      << "  -b       print every input record as 64 binary digits instead\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string inFormat;
  std::string outFormat;
  bool inLegacy = false;
  bool outLegacy = false;
  bool dumpBits = false;
  std::vector<std::string> files;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "-A" || arg == "-a") && i + 1 < argc) {
      (arg == "-A" ? inFormat : outFormat) = argv[++i];
    } else if (arg == "-X") {
      inLegacy = true;
    } else if (arg == "-x") {
      outLegacy = true;
    } else if (arg == "-b") {
      dumpBits = true;
    } else {
      files.push_back(arg);
    }
  }

  const size_t wantedFiles = dumpBits ? 1 : 2;
  if (inFormat.empty() || (!dumpBits && outFormat.empty()) ||
      files.size() != wantedFiles) {
    print_help(argv[0]);
    return 1;
  }

  try {
    const TimestampFormat input = parseTimestampFormat(inFormat);
    if (dumpBits) {
      for (const unsigned long long record :
           readRawWords(files[0], input, inLegacy))
        std::cout << std::bitset<64>(record) << "\n";
      return 0;
    }

    const TimestampFormat output = parseTimestampFormat(outFormat);
    const std::vector<Event> events =
        readTimestamps(files[0], input, inLegacy);
    writeTimestamps(files[1], events, output, outLegacy);
    std::cout << "Converted " << events.size() << " events from " << files[0]
              << " to " << files[1] << "\n";
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }
  return 0;
}
