#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

#include "sigmar/errors.hpp"
#include "sigmar/grids.hpp"
#include "sigmar/options.hpp"

using spdlog::debug;

namespace sigmar
{

// Tolerance (in units of step) for deciding that max sits on the grid
static constexpr double axis_eps = 1e-8;

arma::Col<double> make_axis(const double min, const double max, const double step)
{
  static constexpr std::string_view fname = "make_axis"sv;
  if (!std::isfinite(min) || !std::isfinite(max) || !std::isfinite(step)) [[unlikely]] {
    fail<InvalidOptionError>("{}: non-finite axis ({}, {}, {})", fname, min, max, step);
  }
  if (!(step > 0.0)) [[unlikely]] {
    fail<InvalidOptionError>("{}: step = {} must be positive", fname, step);
  }
  if (max < min) [[unlikely]] {
    fail<InvalidOptionError>("{}: max = {} < min = {}", fname, max, min);
  }

  const double count = std::floor((max - min)/step + axis_eps) + 1.0;
  if (!(count <= static_cast<double>(max_axis_size))) [[unlikely]] {
    fail<InvalidOptionError>("{}: ({} - {})/{} gives {:.6e} samples (max = {})",
      fname, max, min, step, count, max_axis_size);
  }

  const arma::uword n = static_cast<arma::uword>(count);
  arma::Col<double> axis(n);
  for (arma::uword i=0; i<n; i++) {
    axis(i) = min + i*step;
  }
  // min + (n-1)*step may land a few ulp above max
  if (axis(n-1) > max) {
    axis(n-1) = max;
  }
  return axis;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

ScaleRedshiftGrid make_scale_redshift_grid(const SigmaROptions& opt)
{
  static constexpr std::string_view fname = "make_scale_redshift_grid"sv;
  validate_options(opt);
  ScaleRedshiftGrid grid;
  grid.R = make_axis(opt.rmin, opt.rmax, opt.dr);
  grid.z = make_axis(opt.zmin, opt.zmax, opt.dz);
  debug("{}: {} R values in [{}, {}] and {} z values in [{}, {}]", fname,
      grid.R.n_elem, grid.R.min(), grid.R.max(),
      grid.z.n_elem, grid.z.min(), grid.z.max());
  return grid;
}

}  // namespace sigmar
