#include <string>

// ARMADILLO LIB
#include <armadillo>

#include "sigmar/power_spectrum.hpp"
#include "sigmar/structs.hpp"

#ifndef __SIGMAR_IO_HPP
#define __SIGMAR_IO_HPP

namespace sigmar
{

// Whitespace separated table; lines starting with '#' are comments. All rows
// must have the same number of columns. Throws TableIOError.
arma::Mat<double> read_table(const std::string file_name);

// read_table flattened; the file must hold a single row or a single column
arma::Col<double> read_vector(const std::string file_name);

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Sections saved as text: one directory per section, one file per key
// (lower case key + ".txt").
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// Reads k_h.txt, z.txt and p_k.txt. p_k.txt may be stored nk x nz or
// nz x nk (k-major is assumed when nk == nz).
PowerSpectrumTable read_power_spectrum_section(const std::string directory);

// Writes r.txt, z.txt and sigma2.txt (nR x nz), creating the directory.
void write_variance_section(const std::string directory, const VarianceTable& table);

}  // namespace sigmar
#endif // HEADER GUARD
