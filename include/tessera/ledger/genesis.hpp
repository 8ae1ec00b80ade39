#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <tessera/ledger/error.hpp>
#include <tessera/math.hpp>
#include <tessera/protocol.hpp>

namespace tessera::ledger {

namespace defaults {

constexpr std::string_view name      = "Tessera";
constexpr std::string_view symbol    = "TSR";
constexpr std::uint8_t decimals      = 18;
constexpr std::uint64_t supply_units = 1'000'000;

} // namespace defaults

struct genesis_data
{
  std::string name;
  std::string symbol;
  std::uint8_t decimals = 0;
  math::amount initial_supply;
  protocol::account creator{};
};

// units * 10^decimals
result< math::amount > scale_supply( std::uint64_t units, std::uint8_t decimals ) noexcept;

result< genesis_data > make_genesis( const protocol::account& creator,
                                     std::uint64_t supply_units = defaults::supply_units,
                                     std::uint8_t decimals      = defaults::decimals );

} // namespace tessera::ledger
