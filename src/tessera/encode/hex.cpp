#include <tessera/encode/hex.hpp>

#include <cstdint>
#include <optional>

namespace tessera::encode {

namespace {

constexpr std::string_view digits = "0123456789abcdef";
constexpr std::uint8_t nibble_bits = 4;
constexpr std::uint8_t nibble_mask = 0x0f;

std::optional< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= 'A' && c <= 'F' )
    c = static_cast< char >( c - 'A' + 'a' );

  if( auto pos = digits.find( c ); pos != std::string_view::npos )
    return static_cast< std::uint8_t >( pos );

  return {};
}

} // namespace

std::string to_hex( std::span< const std::byte > s )
{
  std::string hex;
  hex.reserve( 2 + s.size() * 2 );
  hex += "0x";

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    hex.push_back( digits[ value >> nibble_bits ] );
    hex.push_back( digits[ value & nibble_mask ] );
  }

  return hex;
}

bool from_hex( std::string_view sv, std::span< std::byte > out ) noexcept
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() != out.size() * 2 )
    return false;

  for( std::size_t i = 0; i < out.size(); ++i )
  {
    auto high = nibble( sv[ 2 * i ] );
    auto low  = nibble( sv[ 2 * i + 1 ] );
    if( !high || !low )
      return false;

    out[ i ] = std::byte( *high << nibble_bits | *low );
  }

  return true;
}

} // namespace tessera::encode
