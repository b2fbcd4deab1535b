#include <array>
#include <cmath>
#include <string_view>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// boost library
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "sigmar/errors.hpp"
#include "sigmar/options.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view errmissing = "{}: required option {} not found"sv;
static constexpr std::string_view errparse = "{}: option {} = '{}' is not a valid {}"sv;

using spdlog::debug;
using spdlog::warn;

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

constexpr std::array<std::string_view, 6> required_keys = {
  "zmin"sv, "zmax"sv, "dz"sv, "rmin"sv, "rmax"sv, "dr"sv
};

constexpr std::array<std::string_view, 3> optional_keys = {
  "matter_power"sv, "crop_klim"sv, "nk_integration"sv
};

bool is_known_key(const std::string& key)
{
  for (const auto& k : required_keys) {
    if (key == k) {
      return true;
    }
  }
  for (const auto& k : optional_keys) {
    if (key == k) {
      return true;
    }
  }
  return false;
}

template <typename T>
T get_value(
    const std::map<std::string, std::string>& kv,
    const std::string_view key,
    const std::string_view type
  )
{
  static constexpr std::string_view fname = "options_from_map"sv;
  auto it = kv.find(std::string(key));
  if (it == kv.end()) [[unlikely]] {
    fail<InvalidOptionError>(errmissing, fname, key);
  }
  try {
    return boost::lexical_cast<T>(boost::trim_copy(it->second));
  }
  catch (const boost::bad_lexical_cast&) {
    fail<InvalidOptionError>(errparse, fname, key, it->second, type);
  }
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

std::string matter_power_section(const MatterPower mp)
{
  switch (mp) {
    case MatterPower::LINEAR:
      return "matter_power_lin";
    case MatterPower::NONLINEAR:
      return "matter_power_nl";
  }
  fail<InvalidOptionError>("{}: unknown matter power", "matter_power_section");
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

MatterPower parse_matter_power(std::string name)
{
  boost::trim(name);
  name = boost::algorithm::to_lower_copy(name);
  if (name == "matter_power_lin") {
    return MatterPower::LINEAR;
  }
  if (name == "matter_power_nl") {
    return MatterPower::NONLINEAR;
  }
  fail<InvalidOptionError>(
      "{}: matter_power = {} not supported "
      "(options: matter_power_lin, matter_power_nl)",
      "parse_matter_power",
      name
    );
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

bool parse_bool(std::string value)
{
  boost::trim(value);
  value = boost::algorithm::to_lower_copy(value);
  if (value == "true" || value == "t" || value == "1" || value == "yes") {
    return true;
  }
  if (value == "false" || value == "f" || value == "0" || value == "no") {
    return false;
  }
  fail<InvalidOptionError>("{}: '{}' is not a boolean", "parse_bool", value);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

SigmaROptions options_from_map(const std::map<std::string, std::string>& kv)
{
  static constexpr std::string_view fname = "options_from_map"sv;
  debug("{}: {}", fname, errbegins);

  for (const auto& [key, value] : kv) {
    if (!is_known_key(key)) {
      warn("{}: option {} = {} not recognized (ignored)", fname, key, value);
    }
  }

  SigmaROptions opt;
  opt.zmin = get_value<double>(kv, "zmin"sv, "real"sv);
  opt.zmax = get_value<double>(kv, "zmax"sv, "real"sv);
  opt.dz   = get_value<double>(kv, "dz"sv, "real"sv);
  opt.rmin = get_value<double>(kv, "rmin"sv, "real"sv);
  opt.rmax = get_value<double>(kv, "rmax"sv, "real"sv);
  opt.dr   = get_value<double>(kv, "dr"sv, "real"sv);

  if (auto it = kv.find("matter_power"); it != kv.end()) {
    opt.matter_power = parse_matter_power(it->second);
  }
  if (auto it = kv.find("crop_klim"); it != kv.end()) {
    opt.crop_klim = parse_bool(it->second);
  }
  if (kv.count("nk_integration")) {
    opt.nk_integration = get_value<int>(kv, "nk_integration"sv, "integer"sv);
  }
  validate_options(opt);

  if (opt.nk_integration % 2 != 0) { // Simpson needs an even number of intervals
    opt.nk_integration++;
  }

  debug("{}: z = [{}, {}] step {}, R = [{}, {}] step {}, {}, crop_klim = {}",
      fname, opt.zmin, opt.zmax, opt.dz, opt.rmin, opt.rmax, opt.dr,
      matter_power_section(opt.matter_power), opt.crop_klim);
  debug("{}: {}", fname, errends);
  return opt;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void validate_options(const SigmaROptions& opt)
{
  static constexpr std::string_view fname = "validate_options"sv;
  const std::array<double, 6> values = {
    opt.zmin, opt.zmax, opt.dz, opt.rmin, opt.rmax, opt.dr
  };
  for (size_t i=0; i<values.size(); i++) {
    if (!std::isfinite(values[i])) [[unlikely]] {
      fail<InvalidOptionError>("{}: {} = {} is not finite",
        fname, required_keys[i], values[i]);
    }
  }
  if (opt.zmin < 0.0) [[unlikely]] {
    fail<InvalidOptionError>("{}: zmin = {} < 0", fname, opt.zmin);
  }
  if (opt.zmax < opt.zmin) [[unlikely]] {
    fail<InvalidOptionError>("{}: zmax = {} < zmin = {}", fname, opt.zmax, opt.zmin);
  }
  if (!(opt.dz > 0.0)) [[unlikely]] {
    fail<InvalidOptionError>("{}: dz = {} must be positive", fname, opt.dz);
  }
  if (!(opt.rmin > 0.0)) [[unlikely]] {
    fail<InvalidOptionError>("{}: rmin = {} must be positive", fname, opt.rmin);
  }
  if (opt.rmax < opt.rmin) [[unlikely]] {
    fail<InvalidOptionError>("{}: rmax = {} < rmin = {}", fname, opt.rmax, opt.rmin);
  }
  if (!(opt.dr > 0.0)) [[unlikely]] {
    fail<InvalidOptionError>("{}: dr = {} must be positive", fname, opt.dr);
  }
  if (opt.nk_integration < 2 || opt.nk_integration > max_nk_integration) [[unlikely]] {
    fail<InvalidOptionError>("{}: nk_integration = {} (min = 2, max = {})",
      fname, opt.nk_integration, max_nk_integration);
  }
}

}  // namespace sigmar
