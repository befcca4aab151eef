#include <custodia/token/transfer_guard.hpp>

namespace custodia::token {

transfer_guard::transfer_guard( ledger& l, allowance_table& allowances ) noexcept:
    _ledger( l ),
    _allowances( allowances )
{}

std::error_code
transfer_guard::transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  if( to == _ledger.self() )
    return token_errc::self_transfer_forbidden;

  return _ledger.transfer( caller, to, value );
}

std::error_code transfer_guard::transfer_from( const protocol::account& spender,
                                               const protocol::account& from,
                                               const protocol::account& to,
                                               const protocol::amount& value )
{
  if( to == _ledger.self() )
    return token_errc::self_transfer_forbidden;

  if( auto error = _allowances.spend( from, spender, value ); error )
    return error;

  return _ledger.transfer( from, to, value );
}

} // namespace custodia::token
