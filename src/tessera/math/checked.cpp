#include <tessera/math/checked.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <vector>

namespace tessera::math {

constexpr unsigned int radix     = 10;
constexpr unsigned int byte_bits = 8;

result< amount > add( const amount& a, const amount& b ) noexcept
{
  amount c = a + b;
  if( c < a || c < b )
    return std::unexpected( math_errc::overflow );

  return c;
}

result< amount > sub( const amount& a, const amount& b ) noexcept
{
  if( b > a )
    return std::unexpected( math_errc::underflow );

  return a - b;
}

result< amount > mul( const amount& a, const amount& b ) noexcept
{
  amount c = a * b;
  if( a != 0 && c / a != b )
    return std::unexpected( math_errc::overflow );

  return c;
}

result< amount > div( const amount& a, const amount& b ) noexcept
{
  if( b == 0 )
    return std::unexpected( math_errc::division_by_zero );

  return a / b;
}

result< amount > pow10( unsigned int exponent ) noexcept
{
  result< amount > value = amount( 1 );

  for( unsigned int i = 0; i < exponent && value; ++i )
    value = mul( *value, radix );

  return value;
}

result< amount > from_string( std::string_view sv ) noexcept
{
  if( sv.empty() )
    return std::unexpected( math_errc::invalid_number );

  result< amount > value = amount( 0 );

  for( char c: sv )
  {
    if( c < '0' || c > '9' )
      return std::unexpected( math_errc::invalid_number );

    auto shifted = mul( *value, radix );
    if( !shifted )
      return shifted;

    value = add( *shifted, amount( static_cast< unsigned int >( c - '0' ) ) );
    if( !value )
      return value;
  }

  return value;
}

std::string to_string( const amount& value )
{
  return value.str();
}

std::array< std::byte, amount_size > to_bytes( const amount& value )
{
  std::vector< std::uint8_t > digits;
  digits.reserve( amount_size );
  boost::multiprecision::export_bits( value, std::back_inserter( digits ), byte_bits );

  std::array< std::byte, amount_size > bytes{};
  std::ranges::transform( digits,
                          bytes.end() - std::ssize( digits ),
                          []( std::uint8_t d )
                          {
                            return std::byte{ d };
                          } );

  return bytes;
}

amount from_bytes( std::span< const std::byte, amount_size > bytes )
{
  std::array< std::uint8_t, amount_size > digits{};
  std::ranges::transform( bytes,
                          digits.begin(),
                          []( std::byte b )
                          {
                            return std::to_integer< std::uint8_t >( b );
                          } );

  amount value;
  boost::multiprecision::import_bits( value, digits.begin(), digits.end(), byte_bits );
  return value;
}

} // namespace tessera::math
