#include "gazeclean/biquad.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace gazeclean {

static constexpr double kPi = 3.141592653589793238462643383279502884;

Biquad::Biquad(const BiquadCoeffs& c) {
  set_coeffs(c);
}

void Biquad::set_coeffs(const BiquadCoeffs& c) {
  c_ = c;
  reset();
}

void Biquad::reset() {
  z1_ = 0.0;
  z2_ = 0.0;
}

double Biquad::process(double x) {
  const double y = c_.b0 * x + z1_;
  z1_ = c_.b1 * x - c_.a1 * y + z2_;
  z2_ = c_.b2 * x - c_.a2 * y;
  return y;
}

BiquadChain::BiquadChain(const std::vector<BiquadCoeffs>& stages) {
  for (const auto& c : stages) add_stage(c);
}

void BiquadChain::add_stage(const BiquadCoeffs& c) {
  stages_.emplace_back(c);
}

void BiquadChain::reset() {
  for (auto& s : stages_) s.reset();
}

double BiquadChain::process(double x) {
  double y = x;
  for (auto& s : stages_) {
    y = s.process(y);
  }
  return y;
}

void BiquadChain::process_inplace(std::vector<double>* x) {
  if (!x) return;
  if (stages_.empty()) return;
  for (double& v : *x) {
    v = process(v);
  }
}

static void validate_design_inputs(double fs_hz, double f0_hz, const char* what) {
  if (!(fs_hz > 0.0)) throw std::runtime_error(std::string(what) + ": fs_hz must be > 0");
  if (!(f0_hz > 0.0)) throw std::runtime_error(std::string(what) + ": f0_hz must be > 0");
  if (!(f0_hz < 0.5 * fs_hz)) {
    throw std::runtime_error(std::string(what) + ": f0_hz must be < fs/2");
  }
}

static BiquadCoeffs normalize(double b0, double b1, double b2, double a0, double a1, double a2) {
  if (a0 == 0.0) throw std::runtime_error("biquad normalize: a0 is zero");
  BiquadCoeffs c;
  c.b0 = b0 / a0;
  c.b1 = b1 / a0;
  c.b2 = b2 / a0;
  c.a1 = a1 / a0;
  c.a2 = a2 / a0;
  return c;
}

BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, "design_lowpass");
  if (!(Q > 0.0)) throw std::runtime_error("design_lowpass: Q must be > 0");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double sinw0 = std::sin(w0);
  const double alpha = sinw0 / (2.0 * Q);

  const double b0 = (1.0 - cosw0) / 2.0;
  const double b1 = (1.0 - cosw0);
  const double b2 = (1.0 - cosw0) / 2.0;
  const double a0 = 1.0 + alpha;
  const double a1 = -2.0 * cosw0;
  const double a2 = 1.0 - alpha;

  return normalize(b0, b1, b2, a0, a1, a2);
}

BiquadCoeffs design_lowpass_first_order(double fs_hz, double f0_hz) {
  validate_design_inputs(fs_hz, f0_hz, "design_lowpass_first_order");

  const double k = std::tan(kPi * f0_hz / fs_hz);
  return normalize(k, k, 0.0, 1.0 + k, k - 1.0, 0.0);
}

std::vector<BiquadCoeffs> design_butterworth_lowpass(size_t order, double cutoff) {
  if (order < 1) throw std::runtime_error("design_butterworth_lowpass: order must be >= 1");
  if (!(cutoff > 0.0 && cutoff < 1.0)) {
    throw std::runtime_error("design_butterworth_lowpass: cutoff must be in (0, 1) (fraction of Nyquist)");
  }

  // Work on a sample grid with fs = 2 so that f0 == cutoff.
  const double fs = 2.0;
  const double n = static_cast<double>(order);

  std::vector<BiquadCoeffs> stages;
  stages.reserve(order / 2 + 1);

  if (order % 2 == 1) {
    stages.push_back(design_lowpass_first_order(fs, cutoff));
  }

  // Pole pairs at angles psi_k from the negative real axis; Q_k = 1 / (2 cos psi_k).
  for (size_t k = 1; k <= order / 2; ++k) {
    const double psi = (order % 2 == 0)
      ? (2.0 * static_cast<double>(k) - 1.0) * kPi / (2.0 * n)
      : static_cast<double>(k) * kPi / n;
    const double q = 1.0 / (2.0 * std::cos(psi));
    stages.push_back(design_lowpass(fs, cutoff, q));
  }

  return stages;
}

static void reflect_pad(const std::vector<double>& x, size_t padlen, std::vector<double>* out) {
  if (!out) return;
  out->clear();
  const size_t n = x.size();
  if (n == 0) return;

  padlen = std::min(padlen, n - 1);
  out->reserve(n + 2 * padlen);

  // Odd reflection about the end points keeps the padded signal continuous in
  // value and slope, so slow pupil drifts do not ring at the edges.
  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * x[0] - x[padlen - i]);
  }

  out->insert(out->end(), x.begin(), x.end());

  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * x[n - 1] - x[n - 2 - i]);
  }
}

void filtfilt_inplace(std::vector<double>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen) {
  if (!x) return;
  const size_t n = x->size();
  if (n < 2) return;
  if (stages.empty()) return;

  const size_t max_pad = n - 1;
  const size_t default_pad = 6 * stages.size();
  if (padlen == 0) {
    padlen = std::min(default_pad, max_pad);
  } else {
    padlen = std::min(padlen, max_pad);
  }

  std::vector<double> xp;
  reflect_pad(*x, padlen, &xp);

  // Low-pass cascades have unit DC gain, so running from zero state on the
  // signal minus its first value matches starting at steady state.
  BiquadChain chain(stages);
  auto run_pass = [&chain](std::vector<double>* v) {
    const double offset = v->front();
    for (double& s : *v) s -= offset;
    chain.reset();
    chain.process_inplace(v);
    for (double& s : *v) s += offset;
  };

  run_pass(&xp);
  std::reverse(xp.begin(), xp.end());
  run_pass(&xp);
  std::reverse(xp.begin(), xp.end());

  for (size_t i = 0; i < n; ++i) {
    (*x)[i] = xp[i + padlen];
  }
}

} // namespace gazeclean
