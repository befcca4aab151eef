#include <custodia/controller/execution_context.hpp>
#include <custodia/controller/frame_guard.hpp>

#include <stdexcept>

namespace custodia::controller {

execution_context::execution_context( const state_db::state_node_ptr& root, chronicler& events ):
    _root( root ),
    _chronicler( events )
{
  if( !_root )
    throw std::runtime_error( "state node does not exist" );
}

std::error_code execution_context::apply( const operation& op )
{
  _nodes.emplace_back( current().make_child() );
  frame_guard guard( _nodes, _chronicler, _chronicler.make_session() );

  if( auto error = op( *this ); error )
    return error;

  guard.commit();
  return token::token_errc::ok;
}

std::size_t execution_context::depth() const noexcept
{
  return _nodes.size();
}

token::result< std::span< const std::byte > > execution_context::get_object( const state_db::object_space& space,
                                                                             std::span< const std::byte > key )
{
  if( auto object = current().get( space, key ); object )
    return *object;

  return std::span< const std::byte >{};
}

std::error_code execution_context::put_object( const state_db::object_space& space,
                                               std::span< const std::byte > key,
                                               std::span< const std::byte > value )
{
  current().put( space, key, value );
  return token::token_errc::ok;
}

std::error_code execution_context::remove_object( const state_db::object_space& space,
                                                  std::span< const std::byte > key )
{
  current().remove( space, key );
  return token::token_errc::ok;
}

std::error_code execution_context::event( protocol::event_data&& data )
{
  _chronicler.push_event( std::move( data ) );
  return token::token_errc::ok;
}

state_db::state_node& execution_context::current() const noexcept
{
  if( _nodes.empty() )
    return *_root;

  return *_nodes.back();
}

} // namespace custodia::controller
