#pragma once

#include <custodia/memory.hpp>
#include <custodia/state_db/state_delta.hpp>
#include <custodia/state_db/types.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>

namespace custodia::state_db {

inline std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

class state_node
{
public:
  state_node() noexcept                = default;
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  virtual ~state_node()                = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  /**
   * Fetch an object if one exists.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  /**
   * Write an object into the state_node.
   */
  template< std::ranges::range ValueType >
  std::int64_t put( const object_space& space, std::span< const std::byte > key, const ValueType& value )
  {
    return mutable_delta()->put( make_compound_key( space, key ), value );
  }

  /**
   * Remove an object from the state_node
   */
  std::int64_t remove( const object_space& space, std::span< const std::byte > key );

  /**
   * Returns a temporary child state node with this node as its parent.
   */
  temporary_state_node_ptr make_child();

  /**
   * Returns the number of child nodes squashed into this node.
   */
  std::uint64_t revision() const;

private:
  virtual std::shared_ptr< state_delta > mutable_delta()      = 0;
  virtual const std::shared_ptr< state_delta >& delta() const = 0;
};

class permanent_state_node final: public state_node
{
public:
  permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  permanent_state_node( const permanent_state_node& node ) = delete;
  permanent_state_node( permanent_state_node&& node )      = delete;
  ~permanent_state_node() override                         = default;

  permanent_state_node& operator=( const permanent_state_node& node ) = delete;
  permanent_state_node& operator=( permanent_state_node&& node )      = delete;

private:
  std::shared_ptr< state_delta > mutable_delta() override;
  const std::shared_ptr< state_delta >& delta() const override;

  std::shared_ptr< state_delta > _delta;
};

class temporary_state_node final: public state_node
{
public:
  temporary_state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  temporary_state_node( const temporary_state_node& ) = delete;
  temporary_state_node( temporary_state_node&& )      = delete;
  ~temporary_state_node() override                    = default;

  temporary_state_node& operator=( const temporary_state_node& ) = delete;
  temporary_state_node& operator=( temporary_state_node&& )      = delete;

  /**
   * Squash the node in to the parent node. This call invalidates this state node.
   */
  void squash();

  /**
   * Whether the node has been squashed.
   */
  bool squashed() const noexcept;

private:
  std::shared_ptr< state_delta > mutable_delta() override;
  const std::shared_ptr< state_delta >& delta() const override;

  std::shared_ptr< state_delta > _delta;
};

} // namespace custodia::state_db
