#include <tessera/ledger/genesis.hpp>

namespace tessera::ledger {

result< math::amount > scale_supply( std::uint64_t units, std::uint8_t decimals ) noexcept
{
  auto scale = math::pow10( decimals );
  if( !scale )
    return scale;

  return math::mul( units, *scale );
}

result< genesis_data > make_genesis( const protocol::account& creator, std::uint64_t supply_units, std::uint8_t decimals )
{
  auto supply = scale_supply( supply_units, decimals );
  if( !supply )
    return std::unexpected( supply.error() );

  genesis_data data;
  data.name           = std::string( defaults::name );
  data.symbol         = std::string( defaults::symbol );
  data.decimals       = decimals;
  data.initial_supply = *supply;
  data.creator        = creator;
  return data;
}

} // namespace tessera::ledger
