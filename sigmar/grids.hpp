// ARMADILLO LIB
#include <armadillo>

#include "sigmar/structs.hpp"

#ifndef __SIGMAR_GRIDS_HPP
#define __SIGMAR_GRIDS_HPP

namespace sigmar
{

constexpr arma::uword max_axis_size = 1000000;

// Samples min, min + step, ... up to and including max (max is reached up to
// round-off, never overshot). Requires step > 0, max >= min and at most
// max_axis_size samples; throws InvalidOptionError otherwise.
arma::Col<double> make_axis(const double min, const double max, const double step);

ScaleRedshiftGrid make_scale_redshift_grid(const SigmaROptions& opt);

}  // namespace sigmar
#endif // HEADER GUARD
