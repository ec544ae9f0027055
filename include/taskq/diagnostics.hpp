#pragma once

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <string>
#include <utility>

namespace taskq
{

enum class diagnostic_level
{
  ignore = 0,
  note,
  warning,
  error,
};

/*! \brief Leveled message sink.
 *
 * The default engine prints `[i] `, `[w] ` and `[e] ` prefixed lines to
 * stderr.  Derived engines override `emit` to redirect or drop messages.
 * `emit` may be called from several worker threads at once.
 */
class diagnostics
{
public:
  virtual ~diagnostics() = default;

  template<typename... Args>
  void report( diagnostic_level level, fmt::format_string<Args...> format, Args&&... args ) const
  {
    if ( level == diagnostic_level::ignore )
    {
      return;
    }
    emit( level, fmt::format( format, std::forward<Args>( args )... ) );
  }

  virtual void emit( diagnostic_level level, std::string const& message ) const
  {
    switch ( level )
    {
    case diagnostic_level::ignore:
      break;
    case diagnostic_level::note:
      fmt::print( stderr, "{}{}\n", fmt::format( fmt::emphasis::bold, "[i] " ), message );
      break;
    case diagnostic_level::warning:
      fmt::print( stderr, "{}{}\n", fmt::format( fmt::emphasis::bold | fg( fmt::color::yellow ), "[w] " ), message );
      break;
    case diagnostic_level::error:
    default:
      fmt::print( stderr, "{}{}\n", fmt::format( fmt::emphasis::bold | fg( fmt::color::red ), "[e] " ), message );
      break;
    }
  }
}; /* diagnostics */

class silent_diagnostics : public diagnostics
{
public:
  void emit( diagnostic_level level, std::string const& message ) const override
  {
    (void)level;
    (void)message;
  }
}; /* silent_diagnostics */

} // taskq
