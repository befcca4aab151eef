#pragma once

#include <custodia/token/allowance_table.hpp>
#include <custodia/token/ledger.hpp>

namespace custodia::token {

/**
 * Caller-facing transfers. Units sent to the ledger's own account could never
 * be moved again, so any transfer to it is refused before state is touched.
 */
class transfer_guard final
{
public:
  transfer_guard( ledger& l, allowance_table& allowances ) noexcept;
  transfer_guard( const transfer_guard& ) = delete;
  transfer_guard( transfer_guard&& )      = delete;
  ~transfer_guard()                       = default;

  transfer_guard& operator=( const transfer_guard& ) = delete;
  transfer_guard& operator=( transfer_guard&& )      = delete;

  std::error_code
  transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );
  std::error_code transfer_from( const protocol::account& spender,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 const protocol::amount& value );

private:
  ledger& _ledger;
  allowance_table& _allowances;
};

} // namespace custodia::token
