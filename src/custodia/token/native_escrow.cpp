#include <custodia/token/native_escrow.hpp>
#include <custodia/token/state.hpp>

#include <limits>

namespace custodia::token {

native_escrow::native_escrow( const protocol::account& custodian ) noexcept:
    _custodian( custodian )
{}

std::error_code
native_escrow::receive( system_interface& system, const protocol::account& from, const protocol::amount& value )
{
  if( from == _custodian )
    return token_errc::self_transfer_forbidden;

  return move( system, from, _custodian, value );
}

std::error_code
native_escrow::release( system_interface& system, const protocol::account& to, const protocol::amount& value )
{
  if( _rejecting.contains( to ) )
    return token_errc::release_failed;

  if( auto error = move( system, _custodian, to, value ); error )
    return error;

  if( _hook )
  {
    if( auto error = _hook( to, value ); error )
      return token_errc::release_failed;
  }

  return token_errc::ok;
}

result< protocol::amount > native_escrow::balance_of( system_interface& system, const protocol::account& account ) const
{
  return state::get_amount( system, state::space::native_balance(), account );
}

std::error_code
native_escrow::fund( system_interface& system, const protocol::account& account, const protocol::amount& value )
{
  auto balance = balance_of( system, account );
  if( !balance )
    return balance.error();

  if( std::numeric_limits< protocol::amount >::max() - value < *balance )
    return token_errc::overflow;

  return state::put_amount( system, state::space::native_balance(), account, *balance + value );
}

const protocol::account& native_escrow::custodian() const noexcept
{
  return _custodian;
}

void native_escrow::reject( const protocol::account& account )
{
  _rejecting.insert( account );
}

void native_escrow::accept( const protocol::account& account )
{
  _rejecting.erase( account );
}

void native_escrow::on_release( release_hook hook )
{
  _hook = std::move( hook );
}

std::error_code native_escrow::move( system_interface& system,
                                     const protocol::account& from,
                                     const protocol::account& to,
                                     const protocol::amount& value )
{
  auto from_balance = balance_of( system, from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return token_errc::insufficient_funds;

  if( from == to )
    return token_errc::ok;

  auto to_balance = balance_of( system, to );
  if( !to_balance )
    return to_balance.error();

  if( std::numeric_limits< protocol::amount >::max() - value < *to_balance )
    return token_errc::overflow;

  if( auto error = state::put_amount( system, state::space::native_balance(), from, *from_balance - value ); error )
    return error;

  return state::put_amount( system, state::space::native_balance(), to, *to_balance + value );
}

} // namespace custodia::token
