#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace tessera::state_db {

using object_key   = std::vector< std::byte >;
using object_value = std::vector< std::byte >;

/**
 * An ordered set of object writes and removals layered over an optional
 * parent. Reads fall through to the parent unless the key was written or
 * removed here. A child collects the effects of one operation; squashing it
 * publishes them to the parent, dropping it discards them.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
public:
  state_delta() = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  void put( object_key&& key, std::span< const std::byte > value );
  void remove( object_key&& key );
  std::optional< std::span< const std::byte > > get( const object_key& key ) const;

  void squash();
  void clear() noexcept;

  bool removed( const object_key& key ) const;
  bool root() const noexcept;
  std::size_t size() const noexcept;

  std::shared_ptr< state_delta > make_child();
  const std::shared_ptr< state_delta >& parent() const noexcept;

private:
  std::shared_ptr< state_delta > _parent;
  std::map< object_key, object_value > _objects;
  std::set< object_key > _removed_objects;
};

} // namespace tessera::state_db
