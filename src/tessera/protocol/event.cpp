#include <tessera/protocol/event.hpp>

#include <algorithm>

namespace tessera::protocol {

static void append_impacted( std::vector< account >& impacted, const account& a )
{
  if( !a.null() && std::ranges::find( impacted, a ) == impacted.end() )
    impacted.push_back( a );
}

std::vector< account > transfer_event::impacted() const
{
  std::vector< account > accounts;
  append_impacted( accounts, from );
  append_impacted( accounts, to );
  return accounts;
}

std::vector< account > approval_event::impacted() const
{
  std::vector< account > accounts;
  append_impacted( accounts, owner );
  append_impacted( accounts, spender );
  return accounts;
}

std::vector< account > mint_event::impacted() const
{
  return { to };
}

std::vector< account > burn_event::impacted() const
{
  return { from };
}

std::vector< account > mint_agent_changed_event::impacted() const
{
  return { agent };
}

} // namespace tessera::protocol
