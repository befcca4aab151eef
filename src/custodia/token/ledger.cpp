#include <custodia/token/ledger.hpp>
#include <custodia/token/state.hpp>

#include <limits>

namespace custodia::token {

ledger::ledger( system_interface& system, const protocol::account& self ) noexcept:
    _system( system ),
    _self( self )
{}

result< protocol::amount > ledger::total_supply() const
{
  return state::get_amount( _system, state::space::supply( _self ), state::key::supply() );
}

result< protocol::amount > ledger::balance_of( const protocol::account& account ) const
{
  return state::get_amount( _system, state::space::balance( _self ), account );
}

std::error_code ledger::mint( const protocol::account& to, const protocol::amount& value )
{
  if( protocol::is_null( to ) )
    return token_errc::invalid_recipient;

  auto supply = total_supply();
  if( !supply )
    return supply.error();

  if( std::numeric_limits< protocol::amount >::max() - value < *supply )
    return token_errc::overflow;

  auto to_balance = balance_of( to );
  if( !to_balance )
    return to_balance.error();

  if( auto error = state::put_amount( _system, state::space::supply( _self ), state::key::supply(), *supply + value );
      error )
    return error;

  if( auto error = state::put_amount( _system, state::space::balance( _self ), to, *to_balance + value ); error )
    return error;

  return _system.event( protocol::transfer_event{ .from = protocol::null_account, .to = to, .value = value } );
}

std::error_code ledger::burn( const protocol::account& from, const protocol::amount& value )
{
  if( protocol::is_null( from ) )
    return token_errc::invalid_sender;

  auto from_balance = balance_of( from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return token_errc::insufficient_balance;

  auto supply = total_supply();
  if( !supply )
    return supply.error();

  // The balance is part of the supply
  if( *supply < value )
    return token_errc::unexpected_object;

  if( auto error = state::put_amount( _system, state::space::supply( _self ), state::key::supply(), *supply - value );
      error )
    return error;

  if( auto error = state::put_amount( _system, state::space::balance( _self ), from, *from_balance - value ); error )
    return error;

  return _system.event( protocol::transfer_event{ .from = from, .to = protocol::null_account, .value = value } );
}

std::error_code
ledger::transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  if( protocol::is_null( from ) )
    return token_errc::invalid_sender;

  if( protocol::is_null( to ) )
    return token_errc::invalid_recipient;

  auto from_balance = balance_of( from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return token_errc::insufficient_balance;

  if( from != to )
  {
    auto to_balance = balance_of( to );
    if( !to_balance )
      return to_balance.error();

    if( auto error = state::put_amount( _system, state::space::balance( _self ), from, *from_balance - value ); error )
      return error;

    if( auto error = state::put_amount( _system, state::space::balance( _self ), to, *to_balance + value ); error )
      return error;
  }

  return _system.event( protocol::transfer_event{ .from = from, .to = to, .value = value } );
}

const protocol::account& ledger::self() const noexcept
{
  return _self;
}

} // namespace custodia::token
