// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <tessera/ledger.hpp>
#include <tessera/log.hpp>

using tessera::ledger::ledger_errc;
using tessera::math::amount;

namespace {

tessera::protocol::account make_account( std::uint8_t id )
{
  tessera::protocol::account a{};
  a.back() = std::byte{ id };
  return a;
}

} // namespace

class ledger_test: public ::testing::Test
{
protected:
  ledger_test():
      creator( make_account( 1 ) ),
      alice( make_account( 2 ) ),
      bob( make_account( 3 ) ),
      charlie( make_account( 4 ) )
  {
    tessera::log::initialize();

    tessera::ledger::genesis_data data;
    data.name           = "Test";
    data.symbol         = "TST";
    data.decimals       = 2;
    data.initial_supply = 1'000;
    data.creator        = creator;

    l = std::make_unique< tessera::ledger::ledger >( data );
  }

  tessera::protocol::account creator;
  tessera::protocol::account alice;
  tessera::protocol::account bob;
  tessera::protocol::account charlie;
  std::unique_ptr< tessera::ledger::ledger > l;
};

TEST_F( ledger_test, genesis )
{
  EXPECT_EQ( l->name(), "Test" );
  EXPECT_EQ( l->symbol(), "TST" );
  EXPECT_EQ( l->decimals(), 2 );
  EXPECT_EQ( l->total_supply(), 1'000 );
  EXPECT_EQ( l->balance_of( creator ), 1'000 );
  EXPECT_EQ( l->balance_of( alice ), 0 );
  EXPECT_EQ( l->allowance( creator, alice ), 0 );
  EXPECT_EQ( l->owner(), creator );
  EXPECT_TRUE( l->mint_agent( creator ) );
  EXPECT_FALSE( l->mint_agent( alice ) );
  EXPECT_TRUE( l->events().empty() );

  tessera::ledger::genesis_data orphan;
  orphan.creator = tessera::protocol::null_account;
  EXPECT_THROW( tessera::ledger::ledger{ orphan }, std::runtime_error );
}

TEST_F( ledger_test, transfer )
{
  auto r = l->transfer( creator, alice, 100 );
  ASSERT_TRUE( r );
  EXPECT_TRUE( *r );
  EXPECT_EQ( l->balance_of( creator ), 900 );
  EXPECT_EQ( l->balance_of( alice ), 100 );

  auto events = l->events();
  ASSERT_EQ( events.size(), 1 );
  auto payload = tessera::protocol::decode< tessera::protocol::transfer_event >( events.front() );
  ASSERT_TRUE( payload );
  EXPECT_EQ( payload->from, creator );
  EXPECT_EQ( payload->to, alice );
  EXPECT_EQ( payload->value, 100 );

  // Short balance and zero value are a false result, not an error
  r = l->transfer( alice, bob, 101 );
  ASSERT_TRUE( r );
  EXPECT_FALSE( *r );

  r = l->transfer( alice, bob, 0 );
  ASSERT_TRUE( r );
  EXPECT_FALSE( *r );

  EXPECT_EQ( l->balance_of( alice ), 100 );
  EXPECT_EQ( l->balance_of( bob ), 0 );
  EXPECT_EQ( l->events().size(), 1 );

  r = l->transfer( alice, tessera::protocol::null_account, 1 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::invalid_argument );
  EXPECT_EQ( l->balance_of( alice ), 100 );
}

TEST_F( ledger_test, transfer_to_self )
{
  auto r = l->transfer( creator, creator, 10 );
  ASSERT_TRUE( r );
  EXPECT_TRUE( *r );
  EXPECT_EQ( l->balance_of( creator ), 1'000 );
  EXPECT_EQ( l->events().size(), 1 );
}

TEST_F( ledger_test, transfer_from )
{
  ASSERT_TRUE( l->approve( creator, bob, 50 ) );

  auto r = l->transfer_from( bob, creator, charlie, 30 );
  ASSERT_TRUE( r );
  EXPECT_TRUE( *r );
  EXPECT_EQ( l->balance_of( creator ), 970 );
  EXPECT_EQ( l->balance_of( charlie ), 30 );
  EXPECT_EQ( l->allowance( creator, bob ), 20 );

  r = l->transfer_from( bob, creator, charlie, 21 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::insufficient_allowance );

  r = l->transfer_from( bob, creator, charlie, 1'001 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::insufficient_balance );

  r = l->transfer_from( bob, creator, tessera::protocol::null_account, 1 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::invalid_argument );

  // Nobody approved alice
  r = l->transfer_from( alice, creator, alice, 1 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::insufficient_allowance );

  EXPECT_EQ( l->balance_of( creator ), 970 );
  EXPECT_EQ( l->balance_of( charlie ), 30 );
  EXPECT_EQ( l->allowance( creator, bob ), 20 );
}

TEST_F( ledger_test, transfer_from_to_self )
{
  ASSERT_TRUE( l->approve( creator, bob, 50 ) );

  auto r = l->transfer_from( bob, creator, creator, 50 );
  ASSERT_TRUE( r );
  EXPECT_EQ( l->balance_of( creator ), 1'000 );
  EXPECT_EQ( l->allowance( creator, bob ), 0 );
}

TEST_F( ledger_test, approve )
{
  auto r = l->approve( creator, alice, 10 );
  ASSERT_TRUE( r );
  EXPECT_TRUE( *r );
  EXPECT_EQ( l->allowance( creator, alice ), 10 );

  r = l->approve( creator, alice, 20 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::allowance_race_condition );
  EXPECT_EQ( l->allowance( creator, alice ), 10 );

  r = l->approve( creator, alice, 0 );
  ASSERT_TRUE( r );
  EXPECT_EQ( l->allowance( creator, alice ), 0 );

  r = l->approve( creator, alice, 20 );
  ASSERT_TRUE( r );
  EXPECT_EQ( l->allowance( creator, alice ), 20 );

  r = l->approve( creator, tessera::protocol::null_account, 0 );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), ledger_errc::invalid_argument );

  auto approvals = l->events();
  ASSERT_EQ( approvals.size(), 3 );
  auto payload = tessera::protocol::decode< tessera::protocol::approval_event >( approvals.back() );
  ASSERT_TRUE( payload );
  EXPECT_EQ( payload->owner, creator );
  EXPECT_EQ( payload->spender, alice );
  EXPECT_EQ( payload->value, 20 );
}

TEST_F( ledger_test, increase_approval )
{
  ASSERT_TRUE( l->increase_approval( creator, alice, 5 ) );
  ASSERT_TRUE( l->increase_approval( creator, alice, 7 ) );
  EXPECT_EQ( l->allowance( creator, alice ), 12 );

  auto payload = tessera::protocol::decode< tessera::protocol::approval_event >( l->events().back() );
  ASSERT_TRUE( payload );
  EXPECT_EQ( payload->value, 12 );

  auto r = l->increase_approval( creator, alice, std::numeric_limits< amount >::max() );
  ASSERT_FALSE( r );
  EXPECT_EQ( r.error(), tessera::math::math_errc::overflow );
  EXPECT_EQ( l->allowance( creator, alice ), 12 );
  EXPECT_EQ( l->events().size(), 2 );
}

TEST_F( ledger_test, decrease_approval )
{
  ASSERT_TRUE( l->increase_approval( creator, alice, 10 ) );

  ASSERT_TRUE( l->decrease_approval( creator, alice, 4 ) );
  EXPECT_EQ( l->allowance( creator, alice ), 6 );

  auto r = l->decrease_approval( creator, alice, 100 );
  ASSERT_TRUE( r );
  EXPECT_TRUE( *r );
  EXPECT_EQ( l->allowance( creator, alice ), 0 );

  auto payload = tessera::protocol::decode< tessera::protocol::approval_event >( l->events().back() );
  ASSERT_TRUE( payload );
  EXPECT_EQ( payload->value, 0 );
}

TEST_F( ledger_test, mint )
{
  EXPECT_FALSE( l->mint( creator, 500 ) );
  EXPECT_EQ( l->total_supply(), 1'500 );
  EXPECT_EQ( l->balance_of( creator ), 1'500 );

  auto events = l->events();
  ASSERT_EQ( events.size(), 2 );
  EXPECT_EQ( events.at( 0 ).name, "transfer" );
  EXPECT_EQ( events.at( 1 ).name, "mint" );
  EXPECT_EQ( events.at( 0 ).sequence, 0 );
  EXPECT_EQ( events.at( 1 ).sequence, 1 );

  auto transfer = tessera::protocol::decode< tessera::protocol::transfer_event >( events.at( 0 ) );
  ASSERT_TRUE( transfer );
  EXPECT_TRUE( transfer->from.null() );
  EXPECT_EQ( transfer->to, creator );
  EXPECT_EQ( transfer->value, 500 );

  EXPECT_EQ( l->mint( alice, 1 ), ledger_errc::unauthorized );

  EXPECT_EQ( l->mint( creator, std::numeric_limits< amount >::max() ), tessera::math::math_errc::overflow );
  EXPECT_EQ( l->total_supply(), 1'500 );
  EXPECT_EQ( l->balance_of( creator ), 1'500 );
  EXPECT_EQ( l->events().size(), 2 );
}

TEST_F( ledger_test, burn_from )
{
  ASSERT_TRUE( l->transfer( creator, alice, 100 ) );

  EXPECT_FALSE( l->burn_from( creator, alice, 40 ) );
  EXPECT_EQ( l->balance_of( alice ), 60 );
  EXPECT_EQ( l->total_supply(), 960 );

  auto events = l->events();
  ASSERT_EQ( events.size(), 3 );
  auto burn = tessera::protocol::decode< tessera::protocol::burn_event >( events.back() );
  ASSERT_TRUE( burn );
  EXPECT_EQ( burn->from, alice );
  EXPECT_EQ( burn->amount, 40 );

  auto transfer = tessera::protocol::decode< tessera::protocol::transfer_event >( events.at( 1 ) );
  ASSERT_TRUE( transfer );
  EXPECT_EQ( transfer->from, alice );
  EXPECT_TRUE( transfer->to.null() );

  EXPECT_EQ( l->burn_from( alice, alice, 1 ), ledger_errc::unauthorized );
  EXPECT_EQ( l->burn_from( creator, alice, 0 ), ledger_errc::invalid_argument );
  EXPECT_EQ( l->burn_from( creator, alice, 61 ), ledger_errc::invalid_argument );
  EXPECT_EQ( l->balance_of( alice ), 60 );
  EXPECT_EQ( l->total_supply(), 960 );
}

TEST_F( ledger_test, burn_self )
{
  ASSERT_FALSE( l->set_mint_agent( creator, alice, true ) );
  ASSERT_FALSE( l->mint( alice, 50 ) );

  EXPECT_FALSE( l->burn_self( alice, 20 ) );
  EXPECT_EQ( l->balance_of( alice ), 30 );
  EXPECT_EQ( l->total_supply(), 1'030 );

  EXPECT_EQ( l->burn_self( alice, 31 ), ledger_errc::invalid_argument );
  EXPECT_EQ( l->burn_self( alice, 0 ), ledger_errc::invalid_argument );

  ASSERT_TRUE( l->transfer( creator, bob, 10 ) );
  EXPECT_EQ( l->burn_self( bob, 10 ), ledger_errc::unauthorized );
  EXPECT_EQ( l->balance_of( bob ), 10 );
}

TEST_F( ledger_test, transfer_ownership )
{
  EXPECT_EQ( l->transfer_ownership( alice, bob ), ledger_errc::unauthorized );
  EXPECT_EQ( l->transfer_ownership( creator, creator ), ledger_errc::invalid_argument );
  EXPECT_EQ( l->transfer_ownership( creator, tessera::protocol::null_account ), ledger_errc::invalid_argument );
  EXPECT_EQ( l->owner(), creator );

  EXPECT_FALSE( l->transfer_ownership( creator, alice ) );
  EXPECT_EQ( l->owner(), alice );
  EXPECT_TRUE( l->events().empty() );

  // Mint agency does not follow ownership
  EXPECT_TRUE( l->mint_agent( creator ) );
  EXPECT_FALSE( l->mint_agent( alice ) );
  EXPECT_EQ( l->set_mint_agent( creator, bob, true ), ledger_errc::unauthorized );
  EXPECT_FALSE( l->set_mint_agent( alice, bob, true ) );
}

TEST_F( ledger_test, set_mint_agent )
{
  EXPECT_EQ( l->set_mint_agent( alice, alice, true ), ledger_errc::unauthorized );
  EXPECT_FALSE( l->mint_agent( alice ) );
  EXPECT_TRUE( l->events().empty() );

  EXPECT_FALSE( l->set_mint_agent( creator, alice, true ) );
  EXPECT_FALSE( l->set_mint_agent( creator, alice, true ) );
  EXPECT_TRUE( l->mint_agent( alice ) );

  // Every call notifies, even when membership is unchanged
  auto events = l->events();
  ASSERT_EQ( events.size(), 2 );
  for( const auto& ev: events )
  {
    auto payload = tessera::protocol::decode< tessera::protocol::mint_agent_changed_event >( ev );
    ASSERT_TRUE( payload );
    EXPECT_EQ( payload->agent, alice );
    EXPECT_TRUE( payload->enabled );
  }

  EXPECT_FALSE( l->set_mint_agent( creator, alice, false ) );
  EXPECT_FALSE( l->mint_agent( alice ) );
  EXPECT_EQ( l->mint( alice, 1 ), ledger_errc::unauthorized );
}

TEST_F( ledger_test, observers )
{
  std::vector< std::uint64_t > sequences;
  l->subscribe(
    [ & ]( const tessera::protocol::event& ev )
    {
      sequences.push_back( ev.sequence );
    } );

  ASSERT_TRUE( l->transfer( creator, alice, 1 ) );
  ASSERT_TRUE( l->approve( creator, alice, 1 ) );
  ASSERT_FALSE( l->approve( creator, alice, 2 ) );
  ASSERT_FALSE( l->mint( creator, 1 ) );

  ASSERT_EQ( sequences.size(), 4 );
  for( std::size_t i = 0; i < sequences.size(); ++i )
    EXPECT_EQ( sequences.at( i ), i );
}

TEST_F( ledger_test, throwing_observer )
{
  std::vector< std::string > seen;
  l->subscribe(
    [ & ]( const tessera::protocol::event& ev )
    {
      seen.push_back( ev.name );
      if( seen.size() == 1 )
        throw std::runtime_error( "observer" );
    } );

  EXPECT_FALSE( l->mint( creator, 10 ) );
  EXPECT_EQ( l->total_supply(), 1'010 );
  EXPECT_EQ( l->balance_of( creator ), 1'010 );

  auto events = l->events();
  ASSERT_EQ( events.size(), 2 );
  EXPECT_EQ( events.at( 0 ).name, "transfer" );
  EXPECT_EQ( events.at( 1 ).name, "mint" );
  EXPECT_EQ( events.at( 1 ).sequence, 1 );

  // The failure on the first event does not stop delivery of the second
  ASSERT_EQ( seen.size(), 2 );
  EXPECT_EQ( seen.at( 1 ), "mint" );

  ASSERT_TRUE( l->transfer( creator, alice, 1 ) );
  EXPECT_EQ( seen.size(), 3 );
  EXPECT_EQ( l->events().back().sequence, 2 );
}

// NOLINTEND
