#pragma once

#include <custodia/state_db/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

namespace custodia::state_db {

/**
 * A set of writes layered over a parent delta. Reads fall through to the
 * parent chain unless the key was written or removed in this delta.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;
  object_map _objects;
  std::set< std::vector< std::byte > > _removed_objects;
  std::uint64_t _revision = 0;

public:
  state_delta() noexcept = default;
  state_delta( const std::shared_ptr< state_delta >& parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Merge this delta into its parent, clear it, and advance the parent's
   * revision.
   */
  void squash();
  void clear() noexcept;

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const noexcept;

  std::uint64_t revision() const noexcept;
  void set_revision( std::uint64_t revision ) noexcept;

  const std::shared_ptr< state_delta >& parent() const noexcept;
  std::shared_ptr< state_delta > make_child();
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ),
                             std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace custodia::state_db
