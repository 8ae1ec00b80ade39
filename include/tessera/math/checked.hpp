#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include <tessera/math/error.hpp>

namespace tessera::math {

/**
 * Token quantities. Fixed width, unsigned, and modular on its own; every
 * mutation of ledger state goes through the checked functions below so
 * wraparound never reaches a balance.
 */
using amount = boost::multiprecision::uint256_t;

constexpr std::size_t amount_size = 32;

result< amount > add( const amount& a, const amount& b ) noexcept;
result< amount > sub( const amount& a, const amount& b ) noexcept;
result< amount > mul( const amount& a, const amount& b ) noexcept;
result< amount > div( const amount& a, const amount& b ) noexcept;

// 10^exponent
result< amount > pow10( unsigned int exponent ) noexcept;

result< amount > from_string( std::string_view sv ) noexcept;
std::string to_string( const amount& value );

// Big-endian, zero padded to amount_size
std::array< std::byte, amount_size > to_bytes( const amount& value );
amount from_bytes( std::span< const std::byte, amount_size > bytes );

} // namespace tessera::math
