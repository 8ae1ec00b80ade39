#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tessera/ledger.hpp>
#include <tessera/math.hpp>
#include <tessera/protocol.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static tessera::protocol::account make_account( std::uint8_t id ) noexcept;

  // value * 10^decimals of the genesis
  tessera::math::amount units( std::uint64_t value ) const;

  // Sum over every account the fixture knows about
  tessera::math::amount sum_of_balances() const;

  std::vector< tessera::protocol::event > events_named( std::string_view name ) const;

  tessera::protocol::account _creator;
  tessera::protocol::account _alice;
  tessera::protocol::account _bob;
  tessera::protocol::account _charlie;

  tessera::ledger::genesis_data _genesis_data;
  std::unique_ptr< tessera::ledger::ledger > _ledger;
};

} // namespace test
