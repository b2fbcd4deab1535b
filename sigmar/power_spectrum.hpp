// ARMADILLO LIB
#include <armadillo>

#ifndef __SIGMAR_POWER_SPECTRUM_HPP
#define __SIGMAR_POWER_SPECTRUM_HPP

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class PowerSpectrumSource
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
class PowerSpectrumSource
{ // Anything that provides P(k,z) over a rectangle [kmin,kmax] x [zmin,zmax]
  public:
    virtual ~PowerSpectrumSource() = default;

    virtual double kmin() const = 0; // h/Mpc

    virtual double kmax() const = 0; // h/Mpc

    virtual double zmin() const = 0;

    virtual double zmax() const = 0;

    // P(k,z) in (Mpc/h)^3. Must be safe to call concurrently.
    // Throws InterpolationRangeError outside [kmin,kmax] x [zmin,zmax].
    virtual double power(const double k, const double z) const = 0;
};
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Class PowerSpectrumTable
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
class PowerSpectrumTable : public PowerSpectrumSource
{ // P(k,z) tabulated on a (k_h, z) grid; P_k(i,j) = P(k_h(i), z(j))
  public:
    // Throws InvalidGridError unless k_h (>= 2 samples, all > 0) and z
    // (>= 1 sample) are strictly increasing, P_k is nk x nz, and no entry
    // is NaN, infinite or negative.
    PowerSpectrumTable(
        arma::Col<double> k_h,
        arma::Col<double> z,
        arma::Mat<double> P_k
      );

    double kmin() const override {
      return this->k_(0);
    }
    double kmax() const override {
      return this->k_(this->k_.n_elem - 1);
    }
    double zmin() const override {
      return this->z_(0);
    }
    double zmax() const override {
      return this->z_(this->z_.n_elem - 1);
    }

    // ln(P) interpolated bilinearly in (ln k, z) when the four samples
    // around (k,z) are positive; P interpolated bilinearly otherwise.
    double power(const double k, const double z) const override;

    int nk() const {
      return static_cast<int>(this->k_.n_elem);
    }
    int nz() const {
      return static_cast<int>(this->z_.n_elem);
    }
    const arma::Col<double>& get_k() const {
      return this->k_;
    }
    const arma::Col<double>& get_z() const {
      return this->z_;
    }
    const arma::Mat<double>& get_P() const {
      return this->P_;
    }
  private:
    arma::Col<double> k_;
    arma::Col<double> lnk_;
    arma::Col<double> z_;
    arma::Mat<double> P_;
    arma::Mat<double> lnP_; // -inf where P == 0
};

}  // namespace sigmar
#endif // HEADER GUARD
