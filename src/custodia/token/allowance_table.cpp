#include <custodia/token/allowance_table.hpp>
#include <custodia/token/state.hpp>

namespace custodia::token {

allowance_table::allowance_table( system_interface& system, const protocol::account& self ) noexcept:
    _system( system ),
    _self( self )
{}

result< protocol::amount > allowance_table::allowance( const protocol::account& owner,
                                                       const protocol::account& spender ) const
{
  return state::get_amount( _system, state::space::allowance( _self ), state::key::allowance( owner, spender ) );
}

std::error_code
allowance_table::approve( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value )
{
  if( protocol::is_null( owner ) )
    return token_errc::invalid_approver;

  if( protocol::is_null( spender ) )
    return token_errc::invalid_spender;

  if( auto error =
        state::put_amount( _system, state::space::allowance( _self ), state::key::allowance( owner, spender ), value );
      error )
    return error;

  return _system.event( protocol::approval_event{ .owner = owner, .spender = spender, .value = value } );
}

std::error_code
allowance_table::spend( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value )
{
  auto current = allowance( owner, spender );
  if( !current )
    return current.error();

  if( *current == protocol::max_amount )
    return token_errc::ok;

  if( *current < value )
    return token_errc::insufficient_allowance;

  const auto remaining = *current - value;

  if( auto error =
        state::put_amount( _system, state::space::allowance( _self ), state::key::allowance( owner, spender ), remaining );
      error )
    return error;

  return _system.event( protocol::approval_event{ .owner = owner, .spender = spender, .value = remaining } );
}

} // namespace custodia::token
