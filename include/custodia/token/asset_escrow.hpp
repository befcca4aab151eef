#pragma once

#include <system_error>

#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::token {

/**
 * Custody of the native asset that backs the ledger's units.
 */
struct asset_escrow
{
  asset_escrow()                      = default;
  asset_escrow( const asset_escrow& ) = delete;
  asset_escrow( asset_escrow&& )      = delete;
  virtual ~asset_escrow()             = default;

  asset_escrow& operator=( const asset_escrow& ) = delete;
  asset_escrow& operator=( asset_escrow&& )      = delete;

  /**
   * Take `value` of the native asset from `from` into custody.
   */
  virtual std::error_code
  receive( system_interface& system, const protocol::account& from, const protocol::amount& value ) = 0;

  /**
   * Send `value` of the native asset out of custody to `to`. Fails with
   * token_errc::release_failed when the recipient does not accept it.
   */
  virtual std::error_code
  release( system_interface& system, const protocol::account& to, const protocol::amount& value ) = 0;
};

} // namespace custodia::token
