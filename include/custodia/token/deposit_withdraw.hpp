#pragma once

#include <custodia/token/allowance_table.hpp>
#include <custodia/token/asset_escrow.hpp>
#include <custodia/token/ledger.hpp>

namespace custodia::token {

/**
 * Exchanges the native asset for ledger units one for one. Deposits take the
 * asset into escrow before minting; withdrawals burn before releasing, so a
 * re-entrant call made during the release sees the burn already applied.
 */
class deposit_withdraw final
{
public:
  deposit_withdraw( system_interface& system, asset_escrow& escrow, ledger& l, allowance_table& allowances ) noexcept;
  deposit_withdraw( const deposit_withdraw& ) = delete;
  deposit_withdraw( deposit_withdraw&& )      = delete;
  ~deposit_withdraw()                         = default;

  deposit_withdraw& operator=( const deposit_withdraw& ) = delete;
  deposit_withdraw& operator=( deposit_withdraw&& )      = delete;

  std::error_code deposit( const protocol::account& caller, const protocol::amount& value );
  std::error_code
  deposit_to( const protocol::account& caller, const protocol::account& recipient, const protocol::amount& value );

  std::error_code withdraw( const protocol::account& caller, const protocol::amount& value );
  std::error_code
  withdraw_to( const protocol::account& caller, const protocol::account& recipient, const protocol::amount& value );
  std::error_code withdraw_from( const protocol::account& caller,
                                 const protocol::account& owner,
                                 const protocol::account& recipient,
                                 const protocol::amount& value );

private:
  std::error_code check_recipient( const protocol::account& recipient ) const;
  std::error_code check_depositor( const protocol::account& caller ) const;
  std::error_code
  mint_deposit( const protocol::account& caller, const protocol::account& recipient, const protocol::amount& value );
  std::error_code
  burn_and_release( const protocol::account& owner, const protocol::account& recipient, const protocol::amount& value );

  system_interface& _system;
  asset_escrow& _escrow;
  ledger& _ledger;
  allowance_table& _allowances;
};

} // namespace custodia::token
