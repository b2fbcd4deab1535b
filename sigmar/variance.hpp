// ARMADILLO LIB
#include <armadillo>

#include "sigmar/power_spectrum.hpp"
#include "sigmar/structs.hpp"

#ifndef __SIGMAR_VARIANCE_HPP
#define __SIGMAR_VARIANCE_HPP

namespace sigmar
{

// crop_klim restricts the k integral to [0.01/R, 100/R] (on top of the
// tabulated range)
constexpr double crop_kR_min = 0.01;
constexpr double crop_kR_max = 100.0;

// Fourier transform of the real-space spherical top-hat of unit volume:
// W(x) = 3 (sin x - x cos x) / x^3, with W(0) = 1.
double tophat_window(const double x);

struct IntegrationLimits
{
  double kmin;
  double kmax;

  bool empty() const {
    return !(this->kmax > this->kmin);
  }
};

IntegrationLimits integration_limits(
    const PowerSpectrumSource& pk,
    const double R,
    const bool crop_klim
  );

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class VarianceComputer
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
class VarianceComputer
{ // sigma^2(R,z) = 1/(2 pi^2) \int dlnk W^2(kR) k^3 P(k,z)
  public:
    explicit VarianceComputer(
        const bool crop_klim = true,
        const int nk_integration = default_nk_integration
      );

    explicit VarianceComputer(const SigmaROptions& opt);

    // Fills sigma2(i,j) = sigma^2(grid.R(i), grid.z(j)). An empty (cropped)
    // k domain contributes zero. Throws InvalidGridError for an empty grid or
    // a non-positive R, and InterpolationRangeError when a requested z is
    // outside the support of pk; nothing is returned on error.
    VarianceTable compute(
        const PowerSpectrumSource& pk,
        const ScaleRedshiftGrid& grid
      ) const;

    // Single (R, z) cell: composite Simpson rule on nk_integration uniform
    // intervals in ln(k) across integration_limits(pk, R, crop_klim).
    double sigma2(
        const PowerSpectrumSource& pk,
        const double R,
        const double z
      ) const;

    bool crop_klim() const {
      return this->crop_klim_;
    }
    int nk_integration() const {
      return this->nk_integration_;
    }
  private:
    bool crop_klim_;
    int nk_integration_; // always even
};

// make_scale_redshift_grid(opt) followed by VarianceComputer(opt).compute
VarianceTable compute_sigma2(
    const PowerSpectrumSource& pk,
    const SigmaROptions& opt
  );

}  // namespace sigmar
#endif // HEADER GUARD
