#include <algorithm>
#include <cmath>
#include <exception>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

#include "sigmar/errors.hpp"
#include "sigmar/grids.hpp"
#include "sigmar/variance.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using vector = arma::Col<double>;
using spdlog::debug;

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double tophat_window(const double x)
{
  if (std::fabs(x) < 1e-3) { // series: avoids the cancellation in sin x - x cos x
    const double x2 = x*x;
    return 1.0 - x2/10.0 + x2*x2/280.0;
  }
  return 3.0*(std::sin(x) - x*std::cos(x))/(x*x*x);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

IntegrationLimits integration_limits(
    const PowerSpectrumSource& pk,
    const double R,
    const bool crop_klim
  )
{
  IntegrationLimits lim = {pk.kmin(), pk.kmax()};
  if (crop_klim) {
    lim.kmin = std::max(lim.kmin, crop_kR_min/R);
    lim.kmax = std::min(lim.kmax, crop_kR_max/R);
  }
  return lim;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class VarianceComputer MEMBER FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

VarianceComputer::VarianceComputer(const bool crop_klim, const int nk_integration) :
  crop_klim_(crop_klim)
{
  if (nk_integration < 2 || nk_integration > max_nk_integration) [[unlikely]] {
    fail<InvalidOptionError>("{}: nk_integration = {} (min = 2, max = {})",
      "VarianceComputer", nk_integration, max_nk_integration);
  }
  // max_nk_integration is even: rounding up cannot overflow
  this->nk_integration_ = nk_integration + (nk_integration % 2);
}

VarianceComputer::VarianceComputer(const SigmaROptions& opt) :
  VarianceComputer(opt.crop_klim, opt.nk_integration)
{
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double VarianceComputer::sigma2(
    const PowerSpectrumSource& pk,
    const double R,
    const double z
  ) const
{
  static constexpr std::string_view fname = "VarianceComputer::sigma2"sv;
  const IntegrationLimits lim = integration_limits(pk, R, this->crop_klim_);
  if (lim.empty()) {
    debug("{}: empty k domain [{:.4e}, {:.4e}] for R = {} (sigma2 = 0)",
      fname, lim.kmin, lim.kmax, R);
    return 0.0;
  }

  const int n = this->nk_integration_;
  const vector lnk = arma::linspace<vector>(std::log(lim.kmin), std::log(lim.kmax), n+1);
  const double h = (lnk(n) - lnk(0))/n;

  double sum = 0.0;
  for (int m=0; m<=n; m++) {
    const double k = std::exp(lnk(m));
    const double W = tophat_window(k*R);
    const double wt = (0 == m || n == m) ? 1.0 : ((m % 2) ? 4.0 : 2.0);
    sum += wt * W*W * k*k*k * pk.power(k, z);
  }
  return sum*h/3.0/(2.0*M_PI*M_PI);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

VarianceTable VarianceComputer::compute(
    const PowerSpectrumSource& pk,
    const ScaleRedshiftGrid& grid
  ) const
{
  static constexpr std::string_view fname = "VarianceComputer::compute"sv;
  debug("{}: {}", fname, errbegins);
  const int nR = static_cast<int>(grid.R.n_elem);
  const int nz = static_cast<int>(grid.z.n_elem);
  if (0 == nR || 0 == nz) [[unlikely]] {
    fail<InvalidGridError>("{}: empty grid (nR = {}, nz = {})", fname, nR, nz);
  }
  for (int i=0; i<nR; i++) {
    if (!std::isfinite(grid.R(i)) || !(grid.R(i) > 0.0)) [[unlikely]] {
      fail<InvalidGridError>("{}: R[{}] = {} must be positive", fname, i, grid.R(i));
    }
  }
  for (int j=0; j<nz; j++) { // throws InterpolationRangeError before any integral
    static_cast<void>(pk.power(pk.kmin(), grid.z(j)));
  }

  VarianceTable res;
  res.R = grid.R;
  res.z = grid.z;
  res.sigma2.zeros(nR, nz);

  // cells are independent: each thread only reads pk and writes its own cell
  std::exception_ptr eptr = nullptr;
  #pragma omp parallel for collapse(2) schedule(dynamic)
  for (int i=0; i<nR; i++) {
    for (int j=0; j<nz; j++) {
      try {
        res.sigma2(i,j) = this->sigma2(pk, grid.R(i), grid.z(j));
      }
      catch (...) {
        #pragma omp critical
        {
          if (!eptr) {
            eptr = std::current_exception();
          }
        }
      }
    }
  }
  if (eptr) [[unlikely]] {
    std::rethrow_exception(eptr);
  }

  debug("{}: sigma2 table {} x {} (crop_klim = {}, nk_integration = {})",
    fname, nR, nz, this->crop_klim_, this->nk_integration_);
  debug("{}: {}", fname, errends);
  return res;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

VarianceTable compute_sigma2(
    const PowerSpectrumSource& pk,
    const SigmaROptions& opt
  )
{
  const ScaleRedshiftGrid grid = make_scale_redshift_grid(opt);
  return VarianceComputer(opt).compute(pk, grid);
}

}  // namespace sigmar
