#include <string>

// ARMADILLO LIB
#include <armadillo>

#ifndef __SIGMAR_STRUCTS_HPP
#define __SIGMAR_STRUCTS_HPP

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// data block section that P(k,z) is read from
enum class MatterPower
{
  LINEAR,    // matter_power_lin
  NONLINEAR  // matter_power_nl
};

constexpr int default_nk_integration = 2048;
constexpr int max_nk_integration = 1 << 20;

struct SigmaROptions
{
  double zmin = 0.0;
  double zmax = 0.0;
  double dz = 0.0;
  double rmin = 0.0;  // Mpc/h
  double rmax = 0.0;  // Mpc/h
  double dr = 0.0;    // Mpc/h
  MatterPower matter_power = MatterPower::LINEAR;
  bool crop_klim = true;
  int nk_integration = default_nk_integration; // Simpson intervals in ln(k)
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Grids
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

struct ScaleRedshiftGrid
{
  arma::Col<double> R; // Mpc/h
  arma::Col<double> z;
};

struct VarianceTable
{
  arma::Col<double> R;
  arma::Col<double> z;
  arma::Mat<double> sigma2; // sigma2(i,j) = sigma^2(R(i), z(j))
};

}  // namespace sigmar
#endif // HEADER GUARD
