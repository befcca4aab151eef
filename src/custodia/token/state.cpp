#include <custodia/token/state.hpp>

#include <algorithm>
#include <utility>

namespace custodia::token::state {

namespace space {

enum class token_id : std::uint32_t // NOLINT(performance-enum-size)
{
  supply,
  balance,
  allowance,
  nonce
};

static state_db::object_space make_space( const protocol::account& ledger, token_id id )
{
  state_db::object_space s{};
  s.address = ledger;
  s.id      = std::to_underlying( id );
  return s;
}

state_db::object_space supply( const protocol::account& ledger )
{
  return make_space( ledger, token_id::supply );
}

state_db::object_space balance( const protocol::account& ledger )
{
  return make_space( ledger, token_id::balance );
}

state_db::object_space allowance( const protocol::account& ledger )
{
  return make_space( ledger, token_id::allowance );
}

state_db::object_space nonce( const protocol::account& ledger )
{
  return make_space( ledger, token_id::nonce );
}

const state_db::object_space& native_balance()
{
  static const state_db::object_space s = []()
  {
    state_db::object_space native{};
    native.system  = true;
    native.address = protocol::program_account( "native" );
    return native;
  }();

  return s;
}

} // namespace space

namespace key {

std::span< const std::byte > supply()
{
  return {};
}

std::array< std::byte, 2 * protocol::account_length > allowance( const protocol::account& owner,
                                                                 const protocol::account& spender )
{
  std::array< std::byte, 2 * protocol::account_length > k{};
  std::ranges::copy( owner, k.begin() );
  std::ranges::copy( spender, k.begin() + protocol::account_length );
  return k;
}

} // namespace key

result< protocol::amount >
get_amount( system_interface& system, const state_db::object_space& space, std::span< const std::byte > key )
{
  auto object = system.get_object( space, key );
  if( !object )
    return std::unexpected( object.error() );

  if( object->empty() )
    return protocol::amount( 0 );

  if( object->size() != protocol::amount_length )
    return std::unexpected( token_errc::unexpected_object );

  return protocol::from_bytes( *object );
}

std::error_code put_amount( system_interface& system,
                            const state_db::object_space& space,
                            std::span< const std::byte > key,
                            const protocol::amount& value )
{
  if( value == 0 )
    return system.remove_object( space, key );

  return system.put_object( space, key, protocol::to_bytes( value ) );
}

} // namespace custodia::token::state
