#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tessera/ledger/chronicler.hpp>
#include <tessera/ledger/error.hpp>
#include <tessera/ledger/genesis.hpp>
#include <tessera/math.hpp>
#include <tessera/protocol.hpp>
#include <tessera/state_db.hpp>

namespace tessera::ledger {

/**
 * A fungible token ledger with an owner and a set of mint agents.
 *
 * Every call is serialized on one mutex. A mutating call runs against a child
 * of the ledger state and a pending event session; both are published only if
 * the call succeeds, so a failed call changes nothing and emits nothing.
 *
 * The caller is the identity the embedding host has already authenticated.
 */
class ledger final
{
public:
  explicit ledger( const genesis_data& data );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  const std::string& name() const noexcept;
  const std::string& symbol() const noexcept;
  std::uint8_t decimals() const noexcept;

  math::amount total_supply() const;
  math::amount balance_of( const protocol::account& account ) const;
  math::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  protocol::account owner() const;
  bool mint_agent( const protocol::account& account ) const;

  /**
   * Returns false, without changing anything, when value is zero or exceeds
   * the caller's balance.
   */
  result< bool > transfer( const protocol::account& caller, const protocol::account& to, const math::amount& value );

  /**
   * Moves value from an account that has approved the caller. Unlike
   * transfer, a short balance or allowance is an error.
   */
  result< bool > transfer_from( const protocol::account& caller,
                                const protocol::account& from,
                                const protocol::account& to,
                                const math::amount& value );

  /**
   * A non-zero allowance can only be set over a zero one. Changing an existing
   * allowance takes two calls, the first setting it to zero.
   */
  result< bool > approve( const protocol::account& caller, const protocol::account& spender, const math::amount& value );
  result< bool > increase_approval( const protocol::account& caller,
                                    const protocol::account& spender,
                                    const math::amount& added_value );

  // Clamps at zero
  result< bool > decrease_approval( const protocol::account& caller,
                                    const protocol::account& spender,
                                    const math::amount& subtracted_value );

  std::error_code mint( const protocol::account& caller, const math::amount& amount );
  std::error_code burn_from( const protocol::account& caller, const protocol::account& from, const math::amount& amount );
  std::error_code burn_self( const protocol::account& caller, const math::amount& amount );

  std::error_code transfer_ownership( const protocol::account& caller, const protocol::account& new_owner );
  std::error_code set_mint_agent( const protocol::account& caller, const protocol::account& agent, bool enabled );

  std::vector< protocol::event > events() const;

  // Observers run on the calling thread while the ledger is locked and must not call back into it
  void subscribe( chronicler::observer o );

private:
  template< typename T, typename Operation >
  result< T > apply( std::string_view operation, const protocol::account& caller, Operation&& op );

  std::error_code burn( state_db::state_delta& state, const protocol::account& from, const math::amount& amount );

  mutable std::mutex _mutex;
  std::shared_ptr< state_db::state_delta > _state;
  chronicler _chronicler;

  const std::string _name;
  const std::string _symbol;
  const std::uint8_t _decimals;
};

} // namespace tessera::ledger
