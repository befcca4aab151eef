#pragma once

#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <custodia/controller.hpp>
#include <custodia/crypto.hpp>
#include <custodia/protocol.hpp>
#include <custodia/token.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  // One whole unit at 18 decimals
  static inline const custodia::protocol::amount unit{ "1000000000000000000" };
  static inline const custodia::protocol::amount genesis_native_balance = 100 * unit;

  static custodia::crypto::secret_key make_secret_key( const std::string& name );
  static custodia::protocol::account make_account( const std::string& name );

  custodia::crypto::recoverable_signature sign_permit( const custodia::crypto::secret_key& signer,
                                                       const custodia::protocol::account& owner,
                                                       const custodia::protocol::account& spender,
                                                       const custodia::protocol::amount& value,
                                                       std::uint64_t deadline ) const;

  /**
   * Logs and returns false if `code` is an error.
   */
  bool verify( std::error_code code ) const;

  /**
   * Total supply equals the sum of known balances and the native asset held by
   * the ledger account.
   */
  bool conserved() const;

  custodia::token::descriptor _descriptor;
  std::shared_ptr< custodia::token::native_escrow > _escrow;
  std::unique_ptr< custodia::controller::controller > _controller;
  custodia::controller::state::genesis_data _genesis_data;
  std::vector< custodia::protocol::account > _accounts;
};

} // namespace test
