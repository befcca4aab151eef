#include <custodia/state_db/state_delta.hpp>
#include <custodia/state_db/state_node.hpp>

namespace custodia::state_db {

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return delta()->get( make_compound_key( space, key ) );
}

std::int64_t state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  return mutable_delta()->remove( make_compound_key( space, key ) );
}

temporary_state_node_ptr state_node::make_child()
{
  return std::make_shared< temporary_state_node >( mutable_delta()->make_child() );
}

std::uint64_t state_node::revision() const
{
  return delta()->revision();
}

permanent_state_node::permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::shared_ptr< state_delta > permanent_state_node::mutable_delta()
{
  return _delta;
}

const std::shared_ptr< state_delta >& permanent_state_node::delta() const
{
  return _delta;
}

} // namespace custodia::state_db
