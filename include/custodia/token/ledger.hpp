#pragma once

#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>
#include <custodia/token/error.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::token {

/**
 * Owner of balances and the total supply. Every mint, burn and transfer emits
 * a transfer event, with a null account standing in for the mint source or the
 * burn destination.
 */
class ledger final
{
public:
  ledger( system_interface& system, const protocol::account& self ) noexcept;
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  result< protocol::amount > total_supply() const;
  result< protocol::amount > balance_of( const protocol::account& account ) const;

  std::error_code mint( const protocol::account& to, const protocol::amount& value );
  std::error_code burn( const protocol::account& from, const protocol::amount& value );
  std::error_code transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  const protocol::account& self() const noexcept;

private:
  system_interface& _system;
  protocol::account _self;
};

} // namespace custodia::token
