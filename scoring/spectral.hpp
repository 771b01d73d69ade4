#ifndef SCORING_SPECTRAL_HPP
#define SCORING_SPECTRAL_HPP

#include <complex>
#include <vector>

#include "proto/evaluation.pb.h"
#include "scoring/grid.hpp"

namespace scoring {

// Forward DFT of position samples taken on grid, returned in centred order
// so that element i corresponds to grid.Frequencies()[i].
// With UNITARY scaling the result approximates the continuous transform
// (1/sqrt(2 pi)) * integral of f(x) exp(-i xi x) dx up to a phase, so that
// the squared norm is preserved. RAW returns the plain unscaled DFT.
std::vector<std::complex<double>> SpectralTransform(
    const std::vector<std::complex<double>>& samples, const Grid& grid,
    proto::SpectralScaling scaling);

// Moves the zero-frequency component to the centre, as numpy.fft.fftshift.
template <typename T>
std::vector<T> FftShift(const std::vector<T>& v) {
  const size_t n = v.size();
  std::vector<T> shifted(n);
  for (size_t i = 0; i < n; i++) shifted[(i + n / 2) % n] = v[i];
  return shifted;
}

}  // namespace scoring

#endif
