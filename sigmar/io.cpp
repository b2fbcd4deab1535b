#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// boost library
#include <boost/algorithm/string.hpp>

#include "sigmar/errors.hpp"
#include "sigmar/io.hpp"

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
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

namespace
{

std::vector<std::string> split_words(std::string line)
{
  std::vector<std::string> words;
  words.reserve(100);
  boost::trim(line);
  boost::split(words, line, boost::is_any_of(" \t"), boost::token_compress_on);
  return words;
}

double to_double(const std::string& word, const std::string& file_name)
{
  try {
    size_t pos = 0;
    const double x = std::stod(word, &pos);
    if (pos != word.size()) {
      throw std::invalid_argument(word);
    }
    return x;
  }
  catch (const std::exception&) { // std::invalid_argument, std::out_of_range
    fail<TableIOError>("{}: file {} has a non-numeric entry '{}'",
      "read_table", file_name, word);
  }
}

std::string section_file(const std::string& directory, const std::string& key)
{
  return (std::filesystem::path(directory) / (key + ".txt")).string();
}

void save_or_fail(const matrix& m, const std::string& file_name)
{
  if (!m.save(file_name, arma::raw_ascii)) [[unlikely]] {
    fail<TableIOError>("{}: file {} cannot be written", "write_variance_section", file_name);
  }
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

matrix read_table(const std::string file_name)
{
  static constexpr std::string_view fname = "read_table"sv;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_name, ec)) [[unlikely]] {
    fail<TableIOError>("{}: {} is not a regular file", fname, file_name);
  }
  std::ifstream input_file(file_name, std::ios::binary);
  if (!input_file.is_open()) [[unlikely]] {
    fail<TableIOError>("{}: file {} cannot be opened", fname, file_name);
  }

  // --------------------------------------------------------
  // Read the entire file into memory
  // --------------------------------------------------------

  std::string tmp;

  input_file.seekg(0,std::ios::end);

  const std::streamoff size = input_file.tellg();
  if (size < 0) [[unlikely]] {
    fail<TableIOError>("{}: file {} is not seekable", fname, file_name);
  }

  tmp.resize(static_cast<size_t>(size));

  input_file.seekg(0,std::ios::beg);

  input_file.read(&tmp[0],tmp.size());

  if (input_file.gcount() != size) [[unlikely]] {
    fail<TableIOError>("{}: file {} cannot be read ({} of {} bytes)",
      fname, file_name, input_file.gcount(), size);
  }

  input_file.close();

  // --------------------------------------------------------
  // Second: Split file into lines
  // --------------------------------------------------------

  std::vector<std::string> lines;
  lines.reserve(5000);

  boost::trim_if(tmp, boost::is_any_of("\t\r\n "));

  boost::split(lines, tmp, boost::is_any_of("\r\n"), boost::token_compress_on);

  // Erase comment/blank lines
  auto check = [](const std::string& mystr) -> bool
  {
    return boost::starts_with(boost::trim_left_copy(mystr), "#") ||
           boost::trim_copy(mystr).empty();
  };
  lines.erase(std::remove_if(lines.begin(), lines.end(), check), lines.end());

  if (lines.empty()) [[unlikely]] {
    fail<TableIOError>("{}: file {} is empty", fname, file_name);
  }

  // --------------------------------------------------------
  // Third: Split line into words
  // --------------------------------------------------------

  const size_t ncols = split_words(lines[0]).size();
  matrix result(lines.size(), ncols);

  for (size_t i=0; i<lines.size(); i++) {
    const std::vector<std::string> words = split_words(lines[i]);
    if (words.size() != ncols) [[unlikely]] {
      fail<TableIOError>("{}: file {} is not well formatted"
                         " (regular table required, line {} has {} != {} columns)",
                         fname, file_name, i, words.size(), ncols);
    }
    for (size_t j=0; j<ncols; j++) {
      result(i,j) = to_double(words[j], file_name);
    }
  }
  debug("{}: file {} has {} x {} entries", fname, file_name, result.n_rows, result.n_cols);
  return result;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

vector read_vector(const std::string file_name)
{
  const matrix table = read_table(file_name);
  if (table.n_rows != 1 && table.n_cols != 1) [[unlikely]] {
    fail<TableIOError>("{}: file {} holds a {} x {} table (1-D array expected)",
      "read_vector", file_name, table.n_rows, table.n_cols);
  }
  return arma::vectorise(table);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

PowerSpectrumTable read_power_spectrum_section(const std::string directory)
{
  static constexpr std::string_view fname = "read_power_spectrum_section"sv;
  debug("{}: {}", fname, errbegins);

  vector k_h = read_vector(section_file(directory, "k_h"));
  vector z = read_vector(section_file(directory, "z"));
  matrix P_k = read_table(section_file(directory, "p_k"));

  if (P_k.n_rows != k_h.n_elem || P_k.n_cols != z.n_elem) {
    if (P_k.n_rows == z.n_elem && P_k.n_cols == k_h.n_elem) {
      debug("{}: p_k stored as (z, k); transposing", fname);
      P_k = P_k.t().eval();
    }
    // anything else is reported by PowerSpectrumTable
  }

  PowerSpectrumTable res(std::move(k_h), std::move(z), std::move(P_k));
  debug("{}: {}", fname, errends);
  return res;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

void write_variance_section(const std::string directory, const VarianceTable& table)
{
  static constexpr std::string_view fname = "write_variance_section"sv;
  debug("{}: {}", fname, errbegins);
  if (table.sigma2.n_rows != table.R.n_elem || table.sigma2.n_cols != table.z.n_elem) [[unlikely]] {
    fail<InvalidGridError>("{}: sigma2 is {} x {} but (R, z) axes are {} x {}",
      fname, table.sigma2.n_rows, table.sigma2.n_cols, table.R.n_elem, table.z.n_elem);
  }

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) [[unlikely]] {
    fail<TableIOError>("{}: directory {} cannot be created ({})",
      fname, directory, ec.message());
  }

  save_or_fail(matrix(table.R), section_file(directory, "r"));
  save_or_fail(matrix(table.z), section_file(directory, "z"));
  save_or_fail(table.sigma2, section_file(directory, "sigma2"));
  debug("{}: {}", fname, errends);
}

}  // namespace sigmar
