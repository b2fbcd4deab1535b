#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

#include "sigmar/errors.hpp"
#include "sigmar/power_spectrum.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errnanit = "{}: NaN/inf found on {} (index {})"sv;
static constexpr std::string_view errnotinc = "{}: {} not strictly increasing at index {} ({} >= {})"sv;
static constexpr std::string_view erroutside = "{}: {} = {} outside the tabulated range [{}, {}]"sv;

using spdlog::debug;

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

namespace
{

// requests this close to a table edge are moved onto the edge
constexpr double edge_tolerance = 1e-10;

// i such that x(i) <= v <= x(i+1), with 0 <= i <= n-2 (x has n >= 2 elements)
int bracket(const arma::Col<double>& x, const double v)
{
  const double* begin = x.memptr();
  const double* end = begin + x.n_elem;
  const int i = static_cast<int>(std::upper_bound(begin, end, v) - begin) - 1;
  return std::clamp(i, 0, static_cast<int>(x.n_elem) - 2);
}

void check_axis(const arma::Col<double>& x, const std::string_view name)
{
  static constexpr std::string_view fname = "PowerSpectrumTable"sv;
  for (int i=0; i<static_cast<int>(x.n_elem); i++) {
    if (!std::isfinite(x(i))) [[unlikely]] {
      fail<InvalidGridError>(errnanit, fname, name, i);
    }
    if (i > 0 && !(x(i) > x(i-1))) [[unlikely]] {
      fail<InvalidGridError>(errnotinc, fname, name, i, x(i-1), x(i));
    }
  }
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class PowerSpectrumTable MEMBER FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

PowerSpectrumTable::PowerSpectrumTable(
    arma::Col<double> k_h,
    arma::Col<double> z,
    arma::Mat<double> P_k
  ) : k_(std::move(k_h)), z_(std::move(z)), P_(std::move(P_k))
{
  static constexpr std::string_view fname = "PowerSpectrumTable"sv;
  debug("{}: {}", fname, errbegins);

  if (this->k_.n_elem < 2) [[unlikely]] {
    fail<InvalidGridError>("{}: k_h has {} samples (min = 2)", fname, this->k_.n_elem);
  }
  if (this->z_.n_elem < 1) [[unlikely]] {
    fail<InvalidGridError>("{}: z has no samples", fname);
  }
  if (this->P_.n_rows != this->k_.n_elem || this->P_.n_cols != this->z_.n_elem) [[unlikely]] {
    fail<InvalidGridError>("{}: P_k is {} x {} but (k_h, z) axes are {} x {}",
      fname, this->P_.n_rows, this->P_.n_cols, this->k_.n_elem, this->z_.n_elem);
  }
  check_axis(this->k_, "k_h"sv);
  check_axis(this->z_, "z"sv);
  if (!(this->k_(0) > 0.0)) [[unlikely]] {
    fail<InvalidGridError>("{}: k_h must be positive (k_h[0] = {})", fname, this->k_(0));
  }

  this->lnP_.set_size(this->P_.n_rows, this->P_.n_cols);
  for (int j=0; j<static_cast<int>(this->P_.n_cols); j++) {
    for (int i=0; i<static_cast<int>(this->P_.n_rows); i++) {
      const double p = this->P_(i,j);
      if (!std::isfinite(p)) [[unlikely]] {
        fail<InvalidGridError>(errnanit, fname, "P_k"sv, i*this->P_.n_cols + j);
      }
      if (p < 0.0) [[unlikely]] {
        fail<InvalidGridError>("{}: negative P_k({}, {}) = {}", fname, i, j, p);
      }
      this->lnP_(i,j) = (p > 0.0) ? std::log(p) : -std::numeric_limits<double>::infinity();
    }
  }
  this->lnk_ = arma::log(this->k_);

  debug("{}: {} k samples in [{:.4e}, {:.4e}] h/Mpc, {} z samples in [{}, {}]",
      fname, this->nk(), this->kmin(), this->kmax(),
      this->nz(), this->zmin(), this->zmax());
  debug("{}: {}", fname, errends);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

double PowerSpectrumTable::power(const double k, const double z) const
{
  static constexpr std::string_view fname = "PowerSpectrumTable::power"sv;
  const int nk = this->nk();
  const int nz = this->nz();

  double lnk = (k > 0.0) ? std::log(k) : -std::numeric_limits<double>::infinity();
  if (!(lnk >= this->lnk_(0) - edge_tolerance &&
        lnk <= this->lnk_(nk-1) + edge_tolerance)) [[unlikely]] {
    fail<InterpolationRangeError>(erroutside, fname, "k"sv, k, this->kmin(), this->kmax());
  }
  lnk = std::clamp(lnk, this->lnk_(0), this->lnk_(nk-1));

  const double ztol = edge_tolerance * std::max(1.0, std::fabs(this->zmax()));
  if (!(z >= this->zmin() - ztol && z <= this->zmax() + ztol)) [[unlikely]] {
    fail<InterpolationRangeError>(erroutside, fname, "z"sv, z, this->zmin(), this->zmax());
  }

  const int i = bracket(this->lnk_, lnk);
  const double tk = (lnk - this->lnk_(i))/(this->lnk_(i+1) - this->lnk_(i));

  int j = 0;
  double tz = 0.0;
  if (nz > 1) {
    const double zc = std::clamp(z, this->zmin(), this->zmax());
    j = bracket(this->z_, zc);
    tz = (zc - this->z_(j))/(this->z_(j+1) - this->z_(j));
  }
  const int j1 = (nz > 1) ? j + 1 : j;

  const arma::Mat<double>& P = this->P_;
  const bool positive = P(i,j) > 0.0 && P(i+1,j) > 0.0 &&
                        P(i,j1) > 0.0 && P(i+1,j1) > 0.0;
  const arma::Mat<double>& Y = positive ? this->lnP_ : this->P_;

  const double y0 = Y(i,j)  + tk*(Y(i+1,j)  - Y(i,j));
  const double y1 = Y(i,j1) + tk*(Y(i+1,j1) - Y(i,j1));
  const double y = y0 + tz*(y1 - y0);
  return positive ? std::exp(y) : y;
}

}  // namespace sigmar
