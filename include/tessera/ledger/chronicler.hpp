#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <tessera/protocol.hpp>

namespace tessera::ledger {

struct chronicler_session
{
  void push_event( protocol::event&& ev );
  std::vector< protocol::event >& events() noexcept;

private:
  std::vector< protocol::event > _events;
};

/**
 * Keeps the ledger's append-only event log. While a session is set, pushed
 * events are held by the session and only reach the log, with sequence
 * numbers, when the session is committed.
 *
 * Observers see events only once the whole batch is in the log. An observer
 * that throws is logged and skipped; it cannot undo or truncate a commit.
 */
class chronicler final
{
public:
  using observer = std::function< void( const protocol::event& ) >;

  void set_session( const std::shared_ptr< chronicler_session >& s ) noexcept;
  void push_event( protocol::event&& ev );
  void commit( chronicler_session& s );

  void subscribe( observer o );

  const std::vector< protocol::event >& events() const noexcept;

private:
  void append( protocol::event&& ev );
  void notify( std::size_t first ) const noexcept;

  std::weak_ptr< chronicler_session > _session;
  std::vector< protocol::event > _events;
  std::vector< observer > _observers;
  std::uint64_t _seq_no = 0;
};

} // namespace tessera::ledger
