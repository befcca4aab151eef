#pragma once

#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>
#include <custodia/token/error.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::token {

/**
 * Owner of spending limits granted by an owner to a spender. An allowance of
 * protocol::max_amount is unlimited and is never decremented.
 */
class allowance_table final
{
public:
  allowance_table( system_interface& system, const protocol::account& self ) noexcept;
  allowance_table( const allowance_table& ) = delete;
  allowance_table( allowance_table&& )      = delete;
  ~allowance_table()                        = default;

  allowance_table& operator=( const allowance_table& ) = delete;
  allowance_table& operator=( allowance_table&& )      = delete;

  result< protocol::amount > allowance( const protocol::account& owner, const protocol::account& spender ) const;

  std::error_code approve( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value );
  std::error_code spend( const protocol::account& owner, const protocol::account& spender, const protocol::amount& value );

private:
  system_interface& _system;
  protocol::account _self;
};

} // namespace custodia::token
