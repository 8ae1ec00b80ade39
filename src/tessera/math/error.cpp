#include <tessera/math/error.hpp>

#include <string>
#include <utility>

namespace tessera::math {

struct _math_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "math";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< math_errc >( condition ) )
    {
      case math_errc::ok:
        return "ok"s;
      case math_errc::overflow:
        return "arithmetic overflow"s;
      case math_errc::underflow:
        return "arithmetic underflow"s;
      case math_errc::division_by_zero:
        return "division by zero"s;
      case math_errc::invalid_number:
        return "invalid number"s;
    }
    std::unreachable();
  }
};

const std::error_category& math_category() noexcept
{
  static _math_category category;
  return category;
}

std::error_code make_error_code( math_errc e )
{
  return std::error_code( static_cast< int >( e ), math_category() );
}

} // namespace tessera::math
