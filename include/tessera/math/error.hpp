#pragma once

#include <expected>
#include <system_error>

namespace tessera::math {

enum class math_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  overflow,
  underflow,
  division_by_zero,
  invalid_number
};

const std::error_category& math_category() noexcept;

std::error_code make_error_code( math_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tessera::math

template<>
struct std::is_error_code_enum< tessera::math::math_errc >: public std::true_type
{};
