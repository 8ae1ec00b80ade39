#pragma once

#include <cstdint>

#include <tessera/math.hpp>
#include <tessera/protocol.hpp>
#include <tessera/state_db.hpp>

namespace tessera::ledger { namespace state {

namespace space {

constexpr std::uint32_t metadata   = 0;
constexpr std::uint32_t supply     = 1;
constexpr std::uint32_t balance    = 2;
constexpr std::uint32_t allowance  = 3;
constexpr std::uint32_t mint_agent = 4;

} // namespace space

// Zero amounts are not stored; an absent object reads as zero.

math::amount total_supply( const state_db::state_delta& state );
void set_total_supply( state_db::state_delta& state, const math::amount& value );

math::amount balance( const state_db::state_delta& state, const protocol::account& account );
void set_balance( state_db::state_delta& state, const protocol::account& account, const math::amount& value );

math::amount
allowance( const state_db::state_delta& state, const protocol::account& owner, const protocol::account& spender );
void set_allowance( state_db::state_delta& state,
                    const protocol::account& owner,
                    const protocol::account& spender,
                    const math::amount& value );

protocol::account owner( const state_db::state_delta& state );
void set_owner( state_db::state_delta& state, const protocol::account& account );

bool mint_agent( const state_db::state_delta& state, const protocol::account& account );
void set_mint_agent( state_db::state_delta& state, const protocol::account& account, bool enabled );

}} // namespace tessera::ledger::state
