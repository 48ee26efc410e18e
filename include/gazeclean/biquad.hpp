#pragma once

#include <cstddef>
#include <vector>

namespace gazeclean {

// Normalized biquad coefficients for Direct Form II Transposed:
//
//   y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
//
// with a0 assumed to be 1.0 (i.e., b* and a* already divided by a0).
// First-order sections use b2 = a2 = 0.
struct BiquadCoeffs {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};
};

class Biquad {
public:
  Biquad() = default;
  explicit Biquad(const BiquadCoeffs& c);

  void set_coeffs(const BiquadCoeffs& c);

  void reset();

  double process(double x);

private:
  BiquadCoeffs c_{};
  double z1_{0.0};
  double z2_{0.0};
};

// A small cascade of biquad filters.
class BiquadChain {
public:
  BiquadChain() = default;
  explicit BiquadChain(const std::vector<BiquadCoeffs>& stages);

  void add_stage(const BiquadCoeffs& c);
  void reset();

  double process(double x);
  void process_inplace(std::vector<double>* x);

private:
  std::vector<Biquad> stages_;
};

// RBJ cookbook low-pass.
BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q);

// First-order low-pass (bilinear transform, prewarped at f0).
BiquadCoeffs design_lowpass_first_order(double fs_hz, double f0_hz);

// Butterworth low-pass of the given order as a cascade of sections.
//
// cutoff is a fraction of the Nyquist frequency, in (0, 1). Odd orders add one
// first-order section.
std::vector<BiquadCoeffs> design_butterworth_lowpass(size_t order, double cutoff);

// Forward-backward filtering ("filtfilt"-style) using a cascade of biquads.
//
// - Applies the cascade forward, then reverses the signal and applies the same
//   cascade again, which cancels the phase response.
// - Uses odd reflection padding and starts each pass at the signal's edge
//   value to reduce edge transients. This assumes unit DC gain (low-pass).
//
// padlen:
// - If 0, a conservative default based on #stages is used.
void filtfilt_inplace(std::vector<double>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen = 0);

} // namespace gazeclean
