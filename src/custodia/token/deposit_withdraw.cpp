#include <custodia/token/deposit_withdraw.hpp>

namespace custodia::token {

deposit_withdraw::deposit_withdraw( system_interface& system,
                                    asset_escrow& escrow,
                                    ledger& l,
                                    allowance_table& allowances ) noexcept:
    _system( system ),
    _escrow( escrow ),
    _ledger( l ),
    _allowances( allowances )
{}

std::error_code deposit_withdraw::deposit( const protocol::account& caller, const protocol::amount& value )
{
  return mint_deposit( caller, caller, value );
}

std::error_code deposit_withdraw::deposit_to( const protocol::account& caller,
                                              const protocol::account& recipient,
                                              const protocol::amount& value )
{
  if( auto error = check_recipient( recipient ); error )
    return error;

  return mint_deposit( caller, recipient, value );
}

std::error_code deposit_withdraw::withdraw( const protocol::account& caller, const protocol::amount& value )
{
  return withdraw_to( caller, caller, value );
}

std::error_code deposit_withdraw::withdraw_to( const protocol::account& caller,
                                               const protocol::account& recipient,
                                               const protocol::amount& value )
{
  if( auto error = check_recipient( recipient ); error )
    return error;

  return burn_and_release( caller, recipient, value );
}

std::error_code deposit_withdraw::withdraw_from( const protocol::account& caller,
                                                 const protocol::account& owner,
                                                 const protocol::account& recipient,
                                                 const protocol::amount& value )
{
  if( auto error = check_recipient( recipient ); error )
    return error;

  if( auto error = _allowances.spend( owner, caller, value ); error )
    return error;

  return burn_and_release( owner, recipient, value );
}

std::error_code deposit_withdraw::check_recipient( const protocol::account& recipient ) const
{
  if( recipient == _ledger.self() )
    return token_errc::self_transfer_forbidden;

  if( protocol::is_null( recipient ) )
    return token_errc::invalid_recipient;

  return token_errc::ok;
}

std::error_code deposit_withdraw::check_depositor( const protocol::account& caller ) const
{
  if( caller == _ledger.self() )
    return token_errc::self_transfer_forbidden;

  if( protocol::is_null( caller ) )
    return token_errc::invalid_sender;

  return token_errc::ok;
}

std::error_code deposit_withdraw::mint_deposit( const protocol::account& caller,
                                                const protocol::account& recipient,
                                                const protocol::amount& value )
{
  if( auto error = check_depositor( caller ); error )
    return error;

  if( auto error = _escrow.receive( _system, caller, value ); error )
    return error;

  if( auto error = _ledger.mint( recipient, value ); error )
    return error;

  return _system.event( protocol::deposit_event{ .to = recipient, .value = value } );
}

std::error_code deposit_withdraw::burn_and_release( const protocol::account& owner,
                                                    const protocol::account& recipient,
                                                    const protocol::amount& value )
{
  if( auto error = _ledger.burn( owner, value ); error )
    return error;

  if( auto error = _system.event( protocol::withdrawal_event{ .from = owner, .value = value } ); error )
    return error;

  return _escrow.release( _system, recipient, value );
}

} // namespace custodia::token
