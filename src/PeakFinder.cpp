#include "PeakFinder.h"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <new>
#include <string>

#include "Errors.h"

namespace {

// One real input buffer plus its half spectrum, planned forward. The
// destructor releases the FFTW allocations.
class RealSpectrum {
public:
    explicit RealSpectrum(int n) : n_(n) {
        in_ = static_cast<double *>(fftw_malloc(sizeof(double) * n_));
        out_ = static_cast<fftw_complex *>(
            fftw_malloc(sizeof(fftw_complex) * spectrumSize()));
        if (in_ == nullptr || out_ == nullptr) {
            release();
            throw std::bad_alloc();
        }
        plan_ = fftw_plan_dft_r2c_1d(n_, in_, out_, FFTW_ESTIMATE);
        std::fill(in_, in_ + n_, 0.0);
    }

    ~RealSpectrum() { release(); }

    RealSpectrum(const RealSpectrum &) = delete;
    RealSpectrum &operator=(const RealSpectrum &) = delete;

    int spectrumSize() const { return n_ / 2 + 1; }

    // Histograms `times` into the buffer, sample = trunc(t / dt) mod n.
    void fold(std::span<const Timestamp> times, Timestamp resolutionPs) {
        const long long n = n_;
        for (const Timestamp t : times) {
            const long long sample = ((t / resolutionPs) % n + n) % n;
            in_[sample] += 1.0;
        }
    }

    void execute() { fftw_execute(plan_); }

    const fftw_complex *spectrum() const { return out_; }

private:
    void release() {
        if (plan_ != nullptr)
            fftw_destroy_plan(plan_);
        fftw_free(in_);
        fftw_free(out_);
        plan_ = nullptr;
        in_ = nullptr;
        out_ = nullptr;
    }

    int n_;
    double *in_ = nullptr;
    fftw_complex *out_ = nullptr;
    fftw_plan plan_ = nullptr;
};

void validatePeakFinder(Timestamp resolutionPs, int bufferLengthLog2) {
    if (resolutionPs <= 0)
        throw ConfigurationError("peak finder resolution must be positive");
    if (bufferLengthLog2 < 1 || bufferLengthLog2 > kMaxPeakFinderBufferLog2)
        throw ConfigurationError("peak finder buffer length must be in 1.." +
                                 std::to_string(kMaxPeakFinderBufferLog2) +
                                 ", got " + std::to_string(bufferLengthLog2));
}

} // namespace

PeakFinderResult peakFinder(std::span<const Timestamp> t1,
                            std::span<const Timestamp> t2,
                            Timestamp resolutionPs, int bufferLengthLog2) {
    validatePeakFinder(resolutionPs, bufferLengthLog2);
    const int n = 1 << bufferLengthLog2;

    RealSpectrum a(n);
    RealSpectrum b(n);
    a.fold(t1, resolutionPs);
    b.fold(t2, resolutionPs);
    a.execute();
    b.execute();

    // conj(A) * B, inverse transformed, is the circular cross-correlation.
    const int m = a.spectrumSize();
    fftw_complex *product =
        static_cast<fftw_complex *>(fftw_malloc(sizeof(fftw_complex) * m));
    double *correlation = static_cast<double *>(fftw_malloc(sizeof(double) * n));
    if (product == nullptr || correlation == nullptr) {
        fftw_free(product);
        fftw_free(correlation);
        throw std::bad_alloc();
    }
    fftw_plan inverse =
        fftw_plan_dft_c2r_1d(n, product, correlation, FFTW_ESTIMATE);
    for (int k = 0; k < m; ++k) {
        const double ar = a.spectrum()[k][0];
        const double ai = a.spectrum()[k][1];
        const double br = b.spectrum()[k][0];
        const double bi = b.spectrum()[k][1];
        product[k][0] = ar * br + ai * bi;
        product[k][1] = ar * bi - ai * br;
    }
    fftw_execute(inverse);

    // FFTW leaves the inverse unnormalised. Pair counts are integers, so
    // rounding removes the floating-point noise before the argmax.
    PeakFinderResult result;
    result.correlation.resize(static_cast<size_t>(n));
    result.timeAxisPs.resize(static_cast<size_t>(n));
    for (int k = 0; k < n; ++k) {
        result.correlation[k] = std::llround(correlation[k] / n);
        result.timeAxisPs[k] = static_cast<Timestamp>(k) * resolutionPs;
    }
    fftw_destroy_plan(inverse);
    fftw_free(product);
    fftw_free(correlation);

    const auto peak =
        std::max_element(result.correlation.begin(), result.correlation.end());
    result.delayPs = result.timeAxisPs[peak - result.correlation.begin()];
    return result;
}
