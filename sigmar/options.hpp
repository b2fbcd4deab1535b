#include <map>
#include <string>

#include "sigmar/structs.hpp"

#ifndef __SIGMAR_OPTIONS_HPP
#define __SIGMAR_OPTIONS_HPP

namespace sigmar
{

// name of the data block section holding P(k,z)
std::string matter_power_section(const MatterPower mp);

MatterPower parse_matter_power(std::string name);

bool parse_bool(std::string value);

// Converts the key/value options given to the module into SigmaROptions.
// zmin, zmax, dz, rmin, rmax and dr are required; matter_power, crop_klim and
// nk_integration fall back to their defaults. Unrecognized keys are ignored
// (with a warning). The result is validated before being returned.
SigmaROptions options_from_map(const std::map<std::string, std::string>& kv);

// throws InvalidOptionError
void validate_options(const SigmaROptions& opt);

}  // namespace sigmar
#endif // HEADER GUARD
