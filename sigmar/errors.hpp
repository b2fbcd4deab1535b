#include <stdexcept>
#include <string>
#include <utility>

// SPDLOG
#include <spdlog/spdlog.h>

#ifndef __SIGMAR_ERRORS_HPP
#define __SIGMAR_ERRORS_HPP

namespace sigmar
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Every error raised by sigmar derives from SigmaRError. None of them is
// recoverable by retrying: the computation is deterministic in its inputs.
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

class SigmaRError : public std::runtime_error
{
  public:
    explicit SigmaRError(const std::string& what) : std::runtime_error(what) {}
};

// k or z axis not strictly increasing, P(k,z) table inconsistent with the
// axes, NaN or negative samples.
class InvalidGridError : public SigmaRError
{
  public:
    explicit InvalidGridError(const std::string& what) : SigmaRError(what) {}
};

// P(k,z) requested outside the native support of the tabulated spectrum.
class InterpolationRangeError : public SigmaRError
{
  public:
    explicit InterpolationRangeError(const std::string& what) : SigmaRError(what) {}
};

class InvalidOptionError : public SigmaRError
{
  public:
    explicit InvalidOptionError(const std::string& what) : SigmaRError(what) {}
};

class TableIOError : public SigmaRError
{
  public:
    explicit TableIOError(const std::string& what) : SigmaRError(what) {}
};

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

// spdlog::critical the message, then throw it as E
template <class E, typename... Args>
[[noreturn]] void fail(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
  const std::string msg = fmt::format(fmt, std::forward<Args>(args)...);
  spdlog::critical(msg);
  throw E(msg);
}

}  // namespace sigmar
#endif // HEADER GUARD
