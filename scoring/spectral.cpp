#include "scoring/spectral.hpp"

#include <cmath>
#include <stdexcept>

#include <unsupported/Eigen/FFT>

namespace scoring {

std::vector<std::complex<double>> SpectralTransform(
    const std::vector<std::complex<double>>& samples, const Grid& grid,
    proto::SpectralScaling scaling) {
  if (samples.size() != grid.Size()) {
    throw std::invalid_argument("sample count does not match the grid");
  }
  Eigen::FFT<double> fft;
  std::vector<std::complex<double>> transformed;
  fft.fwd(transformed, samples);

  switch (scaling) {
    case proto::UNITARY: {
      const double scale = grid.PositionStep() / std::sqrt(2 * M_PI);
      for (auto& value : transformed) value *= scale;
      break;
    }
    case proto::RAW:
      break;
    default:
      throw std::invalid_argument("unknown spectral scaling " +
                                  proto::SpectralScaling_Name(scaling));
  }
  return FftShift(transformed);
}

}  // namespace scoring
