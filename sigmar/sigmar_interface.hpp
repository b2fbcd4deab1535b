#include <string>
#include <string_view>

// SPDLOG
//#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

// ARMADILLO LIB AND PYBIND WRAPPER (CARMA)
#include <carma.h>
#include <armadillo>

// sigmar
#include "sigmar/errors.hpp"
#include "sigmar/grids.hpp"
#include "sigmar/io.hpp"
#include "sigmar/options.hpp"
#include "sigmar/power_spectrum.hpp"
#include "sigmar/structs.hpp"
#include "sigmar/variance.hpp"

// Python Binding
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/pytypes.h>

#ifndef __SIGMAR_SIGMAR_INTERFACE_HPP
#define __SIGMAR_SIGMAR_INTERFACE_HPP

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Python facing layer. The pipeline reads (k_h, z, P_k) from the section named
// by matter_power_section(opt.matter_power), calls compute_sigma2_cpp and
// stores (R, z, sigma2) in the "sigmar" section.
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

constexpr std::string_view output_section = "sigmar";

void initial_setup();

SigmaROptions options_from_dict(const pybind11::dict& options);

pybind11::tuple compute_sigma2_cpp(
    arma::Col<double> k_h,
    arma::Col<double> z,
    arma::Mat<double> P_k,
    const SigmaROptions& opt
  );

pybind11::tuple read_power_spectrum_section_cpp(const std::string directory);

void write_variance_section_cpp(
    const std::string directory,
    arma::Col<double> R,
    arma::Col<double> z,
    arma::Mat<double> sigma2
  );

}  // namespace sigmar
#endif // HEADER GUARD
