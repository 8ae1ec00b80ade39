#include <tessera/protocol/account.hpp>

#include <tessera/encode.hpp>

namespace tessera::protocol {

bool account::null() const noexcept
{
  return *this == null_account;
}

result< account > account_from_hex( std::string_view sv ) noexcept
{
  account a{};
  if( !encode::from_hex( sv, a ) )
    return std::unexpected( protocol_errc::invalid_account );

  return a;
}

std::string to_hex( const account& a )
{
  return encode::to_hex( a );
}

} // namespace tessera::protocol
