#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "Coincidences.h"
#include "G2.h"
#include "PeakFinder.h"
#include "Histograms.h"
#include "ReadTimestamps.h"
#include "Timestamps.h"

// Pybind11 module exposing the histogram and coincidence routines. Python
// callers work in nanoseconds (floats, as numpy timestamp arrays usually are);
// every entry point converts to integer picoseconds once before calling into
// the C++ core.

namespace py = pybind11;

namespace {

std::vector<double> toNanoseconds(const std::vector<Timestamp> &ps) {
  std::vector<double> ns;
  ns.reserve(ps.size());
  for (const Timestamp t : ps)
    ns.push_back(timestampToNanoseconds(t));
  return ns;
}

// Splits decoded events into the (t, p) pair of lists the acquisition scripts
// expect.
py::tuple eventsToTuple(const std::vector<Event> &events) {
  std::vector<double> t;
  std::vector<unsigned> p;
  t.reserve(events.size());
  p.reserve(events.size());
  for (const Event &e : events) {
    t.push_back(timestampToNanoseconds(e.time));
    p.push_back(e.pattern);
  }
  return py::make_tuple(std::move(t), std::move(p));
}

std::vector<Event> tupleToEvents(const std::vector<double> &t_ns,
                                 const std::vector<unsigned> &patterns) {
  if (t_ns.size() != patterns.size())
    throw std::invalid_argument("times and patterns must have equal length");
  std::vector<Event> events(t_ns.size());
  for (size_t i = 0; i < t_ns.size(); ++i)
    events[i] = {nanosecondsToTimestamp(t_ns[i]), patterns[i]};
  return events;
}

} // namespace

PYBIND11_MODULE(g2finder, m) {
  m.doc() = "Python bindings for the G2Finder C++ library";

  // --- Bind Event struct ---
  py::class_<Event>(m, "Event")
      .def(py::init<>())
      .def(py::init([](Timestamp time_ps, unsigned pattern) {
             return Event{time_ps, pattern};
           }),
           py::arg("time_ps"), py::arg("pattern"))
      .def_readwrite("time_ps", &Event::time)
      .def_readwrite("pattern", &Event::pattern)
      .def("__repr__", [](const Event &e) {
        return "<Event time_ps=" + std::to_string(e.time) +
               ", pattern=" + std::to_string(e.pattern) + ">";
      });

  // --- Bind Histograms.h functions ---
  m.def(
      "pairwise_histogram",
      [](const std::vector<double> &t1, const std::vector<double> &t2,
         int bins, double bin_width_ns) {
        const auto a = nanosecondsToTimestamps(t1);
        const auto b = nanosecondsToTimestamps(t2);
        return pairwiseHistogram(
            a, b, HistogramConfig::fromNanoseconds(bins, bin_width_ns));
      },
      py::arg("t1"), py::arg("t2"), py::arg("bins") = 500,
      py::arg("bin_width_ns") = 2.0,
      "Start/stop histogram: for each t1 the nearest t2 at or after it "
      "(nanoseconds)");

  m.def(
      "masked_pairwise_histogram",
      [](const std::vector<double> &t1, const std::vector<double> &t2,
         int bins, double bin_width_ns) {
        const auto a = nanosecondsToTimestamps(t1);
        const auto b = nanosecondsToTimestamps(t2);
        MaskedHistogram r = maskedPairwiseHistogram(
            a, b, HistogramConfig::fromNanoseconds(bins, bin_width_ns));
        return py::make_tuple(std::move(r.histogram), std::move(r.mask1),
                              std::move(r.mask2));
      },
      py::arg("t1"), py::arg("t2"), py::arg("bins") = 500,
      py::arg("bin_width_ns") = 2.0,
      "Start/stop histogram plus participation masks; returns "
      "(histogram, mask1, mask2).");

  m.def(
      "triple_conditional_histogram",
      [](const std::vector<double> &t1, const std::vector<double> &t2,
         const std::vector<double> &t3, int bins, double bin_width_ns) {
        const auto a = nanosecondsToTimestamps(t1);
        const auto b = nanosecondsToTimestamps(t2);
        const auto c = nanosecondsToTimestamps(t3);
        TripleHistogram h = tripleConditionalHistogram(
            a, b, c, HistogramConfig::fromNanoseconds(bins, bin_width_ns));
        return py::make_tuple(std::move(h.ba), std::move(h.ca),
                              std::move(h.cb), std::move(h.bc));
      },
      py::arg("t1"), py::arg("t2"), py::arg("t3"), py::arg("bins") = 500,
      py::arg("bin_width_ns") = 2.0,
      "Heralded histograms with herald t1; returns (h_ba, h_ca, h_cb, h_bc).");

  m.def(
      "pairwise_histogram_partitioned",
      [](const std::vector<double> &t1, const std::vector<double> &t2,
         int bins, double bin_width_ns, int partitions) {
        const auto a = nanosecondsToTimestamps(t1);
        const auto b = nanosecondsToTimestamps(t2);
        py::gil_scoped_release release;
        return pairwiseHistogramPartitioned(
            a, b, HistogramConfig::fromNanoseconds(bins, bin_width_ns),
            partitions);
      },
      py::arg("t1"), py::arg("t2"), py::arg("bins") = 500,
      py::arg("bin_width_ns") = 2.0, py::arg("partitions") = 0,
      "pairwise_histogram computed on OpenMP threads");

  // --- Bind Coincidences.h functions ---
  m.def(
      "count_coincidences",
      [](const std::vector<double> &t_ns, const std::vector<unsigned> &patterns,
         double coinc_window_ns, int channels) {
        const auto events = tupleToEvents(t_ns, patterns);
        return countCoincidences(events, nanosecondsToTimestamp(coinc_window_ns),
                                 channels);
      },
      py::arg("t"), py::arg("patterns"), py::arg("coinc_window_ns"),
      py::arg("channels") = kDefaultChannels,
      "Count N-fold coincidences in an interleaved (t, pattern) stream");

  m.def(
      "count_coincidences_multi",
      [](const std::vector<std::vector<double>> &streams,
         double coinc_window_ns) {
        std::vector<std::vector<Timestamp>> owned;
        owned.reserve(streams.size());
        for (const auto &s : streams)
          owned.push_back(nanosecondsToTimestamps(s));
        std::vector<std::span<const Timestamp>> spans;
        spans.reserve(owned.size());
        for (const auto &s : owned)
          spans.emplace_back(s.data(), s.size());
        return countCoincidencesMulti(spans,
                                      nanosecondsToTimestamp(coinc_window_ns));
      },
      py::arg("streams"), py::arg("coinc_window_ns"),
      "Count N-fold coincidences across per-channel timestamp lists");

  // --- Bind ReadTimestamps.h functions ---
  m.def(
      "read_a0", [](const std::string &filename) {
        return eventsToTuple(readA0(filename));
      },
      py::arg("filename"), "Read an a0 (hex words) file; returns (t_ns, p).");

  m.def(
      "read_a1",
      [](const std::string &filename, bool legacy, bool ignore_rollover,
         bool highres) {
        return eventsToTuple(
            readA1(filename, legacy, ignore_rollover, highres));
      },
      py::arg("filename"), py::arg("legacy") = false,
      py::arg("ignore_rollover") = true, py::arg("highres") = true,
      "Read an a1 (binary) file; returns (t_ns, p).");

  m.def(
      "read_a2", [](const std::string &filename) {
        return eventsToTuple(readA2(filename));
      },
      py::arg("filename"), "Read an a2 (hex events) file; returns (t_ns, p).");

  m.def(
      "read_timestamps_auto",
      [](const std::string &filename, bool legacy) {
        return eventsToTuple(readTimestampsAuto(filename, legacy));
      },
      py::arg("filename"), py::arg("legacy") = false,
      "Read a raw timestamp file, format chosen by suffix; returns (t_ns, p).");

  m.def(
      "read_bits",
      [](const std::string &filename, int mode, bool legacy) {
        return readRawWords(filename, parseTimestampFormat(std::to_string(mode)),
                            legacy);
      },
      py::arg("filename"), py::arg("mode") = 2, py::arg("legacy") = false,
      "Raw 64-bit records of an a0/a1/a2 file (mode 0, 1 or 2).");

  m.def(
      "write_a0",
      [](const std::string &filename, const std::vector<double> &t_ns,
         const std::vector<unsigned> &patterns) {
        writeA0(filename, tupleToEvents(t_ns, patterns));
      },
      py::arg("filename"), py::arg("t"), py::arg("patterns"),
      "Write events as an a0 (hex words) file");

  m.def(
      "write_a1",
      [](const std::string &filename, const std::vector<double> &t_ns,
         const std::vector<unsigned> &patterns, bool legacy) {
        writeA1(filename, tupleToEvents(t_ns, patterns), legacy);
      },
      py::arg("filename"), py::arg("t"), py::arg("patterns"),
      py::arg("legacy") = false, "Write events as an a1 (binary) file");

  m.def(
      "write_a2",
      [](const std::string &filename, const std::vector<double> &t_ns,
         const std::vector<unsigned> &patterns) {
        writeA2(filename, tupleToEvents(t_ns, patterns));
      },
      py::arg("filename"), py::arg("t"), py::arg("patterns"),
      "Write events as an a2 (hex text) file");

  // --- Bind G2.h functions ---
  m.def(
      "g2_extr",
      [](const std::string &filename, int bins, double bin_width_ns,
         double min_range_ns, int channel_start, int channel_stop,
         double c_stop_delay_ns, bool highres_tscard) {
        // Acquisition cards store the high word first and keep rollover
        // records in the stream.
        const auto events = readA1(filename, true, false, highres_tscard);
        const G2Result r = extractG2(
            events, HistogramConfig::fromNanoseconds(bins, bin_width_ns),
            channel_start, channel_stop, nanosecondsToTimestamp(c_stop_delay_ns),
            nanosecondsToTimestamp(min_range_ns));
        return py::make_tuple(r.histogram, toNanoseconds(r.timeAxisPs),
                              r.startCount, r.stopCount,
                              timestampToNanoseconds(r.spanPs));
      },
      py::arg("filename"), py::arg("bins") = 100, py::arg("bin_width") = 2.0,
      py::arg("min_range") = 0.0, py::arg("channel_start") = 0,
      py::arg("channel_stop") = 1, py::arg("c_stop_delay") = 0.0,
      py::arg("highres_tscard") = false,
      "g2 histogram from a raw a1 file; returns (histogram, dt_ns, "
      "start_events, stop_events, span_ns).");

  // --- Bind PeakFinder.h ---
  m.def(
      "peak_finder",
      [](const std::vector<double> &t1, const std::vector<double> &t2,
         double t_resolution_ns, int buffer_length) {
        const auto a = nanosecondsToTimestamps(t1);
        const auto b = nanosecondsToTimestamps(t2);
        const PeakFinderResult r = peakFinder(
            a, b, nanosecondsToTimestamp(t_resolution_ns), buffer_length);
        return py::make_tuple(timestampToNanoseconds(r.delayPs), r.correlation,
                              toNanoseconds(r.timeAxisPs));
      },
      py::arg("t1_series"), py::arg("t2_series"), py::arg("t_resolution"),
      py::arg("buffer_length"),
      "Delay of t2 relative to t1 from the FFT cross-correlation of both "
      "series folded onto 2**buffer_length samples; returns (delay_ns, "
      "correlation, t_ns).");
}
