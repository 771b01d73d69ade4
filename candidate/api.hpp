#ifndef CANDIDATE_API_HPP
#define CANDIDATE_API_HPP

// Force-included into every candidate compilation. Declaring the entry
// points here gives the candidate's definitions C linkage, so that the runner
// can resolve them by name. A candidate defines at least one of them.

#include <cmath>
#include <complex>
#include <vector>

extern "C" {

// Samples the wavefunction on all the positions at once. Must return one
// value per position.
std::vector<std::complex<double>> get_wavefunction(
    const std::vector<double>& x);

// Samples the wavefunction at a single position.
std::complex<double> wavefunction_at(double x);

// Selects an analytic family, e.g. "type=supergauss a=1.2 p=4".
const char* candidate_params();

}  // extern "C"

#endif
