#include <map>
#include <utility>

#include "sigmar/sigmar_interface.hpp"

using namespace std::literals; // enables "sv" literal
namespace py = pybind11;

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;

using vector = arma::Col<double>;
using matrix = arma::Mat<double>;
using spdlog::debug;

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// INIT FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void initial_setup()
{
  static constexpr std::string_view fname = "initial_setup"sv;
  spdlog::cfg::load_env_levels();
  debug("{}: {}", fname, errbegins);
  debug("{}: {}", fname, errends);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

SigmaROptions options_from_dict(const py::dict& options)
{
  std::map<std::string, std::string> kv;
  for (const auto& item : options) {
    // str() of a python bool is True/False, accepted by parse_bool
    kv[py::str(item.first).cast<std::string>()] =
      py::str(item.second).cast<std::string>();
  }
  return options_from_map(kv);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// COMPUTE FUNCTIONS
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

py::tuple compute_sigma2_cpp(
    vector k_h,
    vector z,
    matrix P_k,
    const SigmaROptions& opt
  )
{
  static constexpr std::string_view fname = "compute_sigma2_cpp"sv;
  debug("{}: {}", fname, errbegins);
  VarianceTable res;
  {
    // the numerical work does not touch python objects
    py::gil_scoped_release release;
    const PowerSpectrumTable pk(std::move(k_h), std::move(z), std::move(P_k));
    res = compute_sigma2(pk, opt);
  }
  debug("{}: {}", fname, errends);
  return py::make_tuple(carma::col_to_arr(std::move(res.R)),
                        carma::col_to_arr(std::move(res.z)),
                        carma::mat_to_arr(std::move(res.sigma2)));
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

py::tuple read_power_spectrum_section_cpp(const std::string directory)
{
  const PowerSpectrumTable pk = read_power_spectrum_section(directory);
  vector k_h = pk.get_k();
  vector z = pk.get_z();
  matrix P_k = pk.get_P();
  return py::make_tuple(carma::col_to_arr(std::move(k_h)),
                        carma::col_to_arr(std::move(z)),
                        carma::mat_to_arr(std::move(P_k)));
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void write_variance_section_cpp(
    const std::string directory,
    vector R,
    vector z,
    matrix sigma2
  )
{
  VarianceTable table;
  table.R = std::move(R);
  table.z = std::move(z);
  table.sigma2 = std::move(sigma2);
  write_variance_section(directory, table);
}

}  // namespace sigmar

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// PYTHON MODULE
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

PYBIND11_MODULE(sigmar_interface, m)
{
  using namespace sigmar;
  m.doc() = "sigma^2(R,z): variance of the matter density field smoothed "
            "with a spherical top-hat of radius R";

  // -------------------------------------------------------------------------
  // errors
  // -------------------------------------------------------------------------

  // translators are tried newest first: the derived errors before the base
  auto& base = py::register_exception<SigmaRError>(m, "SigmaRError", PyExc_RuntimeError);
  py::register_exception<InvalidGridError>(m, "InvalidGridError", base);
  py::register_exception<InterpolationRangeError>(m, "InterpolationRangeError", base);
  py::register_exception<InvalidOptionError>(m, "InvalidOptionError", base);
  py::register_exception<TableIOError>(m, "TableIOError", base);

  // -------------------------------------------------------------------------
  // options
  // -------------------------------------------------------------------------

  py::enum_<MatterPower>(m, "MatterPower")
    .value("LINEAR", MatterPower::LINEAR)
    .value("NONLINEAR", MatterPower::NONLINEAR);

  py::class_<SigmaROptions>(m, "SigmaROptions")
    .def(py::init<>())
    .def_readwrite("zmin", &SigmaROptions::zmin)
    .def_readwrite("zmax", &SigmaROptions::zmax)
    .def_readwrite("dz", &SigmaROptions::dz)
    .def_readwrite("rmin", &SigmaROptions::rmin)
    .def_readwrite("rmax", &SigmaROptions::rmax)
    .def_readwrite("dr", &SigmaROptions::dr)
    .def_readwrite("matter_power", &SigmaROptions::matter_power)
    .def_readwrite("crop_klim", &SigmaROptions::crop_klim)
    .def_readwrite("nk_integration", &SigmaROptions::nk_integration);

  m.attr("output_section") = std::string(output_section);

  m.def("initial_setup",
    &initial_setup,
    "Set spdlog levels from the SPDLOG_LEVEL environment variable");

  m.def("options_from_dict",
    &options_from_dict,
    "Convert module options {name: value} into SigmaROptions",
    py::arg("options"));

  m.def("matter_power_section",
    &matter_power_section,
    "Name of the section holding P(k,z)",
    py::arg("matter_power"));

  // -------------------------------------------------------------------------
  // compute
  // -------------------------------------------------------------------------

  m.def("compute_sigma2",
    &compute_sigma2_cpp,
    "Return (R, z, sigma2) with sigma2[i,j] = sigma^2(R[i], z[j])",
    py::arg("k_h"),
    py::arg("z"),
    py::arg("P_k"),
    py::arg("options"));

  m.def("tophat_window",
    &tophat_window,
    "W(x) = 3 (sin x - x cos x) / x^3",
    py::arg("x"));

  // -------------------------------------------------------------------------
  // text sections
  // -------------------------------------------------------------------------

  m.def("read_power_spectrum_section",
    &read_power_spectrum_section_cpp,
    "Read (k_h, z, P_k) from a section saved as text",
    py::arg("directory"));

  m.def("write_variance_section",
    &write_variance_section_cpp,
    "Write (R, z, sigma2) as a text section",
    py::arg("directory"),
    py::arg("R"),
    py::arg("z"),
    py::arg("sigma2"));
}
