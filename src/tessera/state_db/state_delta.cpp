#include <tessera/state_db/state_delta.hpp>

#include <stdexcept>

namespace tessera::state_db {

void state_delta::put( object_key&& key, std::span< const std::byte > value )
{
  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ), object_value( value.begin(), value.end() ) );
}

void state_delta::remove( object_key&& key )
{
  if( !get( key ) )
    return;

  _objects.erase( key );

  // The root has nothing beneath it to mask
  if( !root() )
    _removed_objects.emplace( std::move( key ) );
}

std::optional< std::span< const std::byte > > state_delta::get( const object_key& key ) const
{
  for( const state_delta* node = this; node; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto itr = node->_objects.find( key ); itr != node->_objects.end() )
      return std::span< const std::byte >( itr->second );
  }

  return {};
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a state delta with no parent" );

  auto& parent = *_parent;

  // A removal here masks the parent's object. If the parent is the root the
  // object is simply gone, otherwise the parent inherits the mask.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._objects.erase( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  for( auto itr = _objects.begin(); itr != _objects.end(); itr = _objects.begin() )
  {
    auto node = _objects.extract( itr );
    parent._removed_objects.erase( node.key() );
    parent._objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }
}

void state_delta::clear() noexcept
{
  _objects.clear();
  _removed_objects.clear();
}

bool state_delta::removed( const object_key& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const noexcept
{
  return !_parent;
}

std::size_t state_delta::size() const noexcept
{
  return _objects.size();
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child     = std::make_shared< state_delta >();
  child->_parent = shared_from_this();
  return child;
}

const std::shared_ptr< state_delta >& state_delta::parent() const noexcept
{
  return _parent;
}

} // namespace tessera::state_db
