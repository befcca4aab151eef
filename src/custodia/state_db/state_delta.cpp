#include <custodia/state_db/state_delta.hpp>

namespace custodia::state_db {

state_delta::state_delta( const std::shared_ptr< state_delta >& parent ) noexcept:
    _parent( parent ),
    _revision( parent ? parent->revision() : 0 )
{}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  std::int64_t size = 0;

  if( auto itr = _objects.find( key ); itr != _objects.end() )
  {
    size -= std::ssize( itr->first ) + std::ssize( itr->second );
    _objects.erase( itr );
  }

  if( root() )
    return size;

  if( auto parent_value = _parent->get( key ); parent_value )
  {
    if( size == 0 )
      size -= std::ssize( key ) + std::ssize( *parent_value );

    _removed_objects.emplace( std::move( key ) );
  }

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const auto* node = this; node != nullptr; node = node->_parent.get() )
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
    if( !parent.root() )
      parent._removed_objects.erase( itr->first );

    auto node = _objects.extract( itr );
    parent._objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }

  parent.set_revision( parent.revision() + 1 );
}

void state_delta::clear() noexcept
{
  _objects.clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const noexcept
{
  return !_parent;
}

std::uint64_t state_delta::revision() const noexcept
{
  return _revision;
}

void state_delta::set_revision( std::uint64_t revision ) noexcept
{
  _revision = revision;
}

const std::shared_ptr< state_delta >& state_delta::parent() const noexcept
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  return std::make_shared< state_delta >( shared_from_this() );
}

} // namespace custodia::state_db
