#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <boost/serialization/array_wrapper.hpp>

#include <tessera/protocol/error.hpp>

namespace tessera::protocol {

constexpr std::size_t account_size = 32;

/**
 * Identity of a token holder or actor. The host authenticates callers before
 * they reach the ledger; here an account is only compared and used as a key.
 * The all-zero value is reserved as the null account, the counterparty of
 * mint and burn transfers.
 */
struct account: std::array< std::byte, account_size >
{
  bool null() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & boost::serialization::make_array( data(), size() );
  }
};

inline constexpr account null_account{};

result< account > account_from_hex( std::string_view sv ) noexcept;
std::string to_hex( const account& a );

} // namespace tessera::protocol
