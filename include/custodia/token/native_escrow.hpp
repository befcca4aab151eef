#pragma once

#include <functional>
#include <set>

#include <custodia/token/asset_escrow.hpp>

namespace custodia::token {

/**
 * The native asset of the host, kept in a system object space of the same
 * state database as the ledger. Native balances are therefore written and
 * rolled back together with the operation that moves them.
 */
class native_escrow final: public asset_escrow
{
public:
  /**
   * Runs after a release has credited its recipient, inside the same
   * operation. Returning an error fails the release.
   */
  using release_hook = std::function< std::error_code( const protocol::account&, const protocol::amount& ) >;

  native_escrow( const protocol::account& custodian ) noexcept;
  native_escrow( const native_escrow& ) = delete;
  native_escrow( native_escrow&& )      = delete;
  ~native_escrow() override             = default;

  native_escrow& operator=( const native_escrow& ) = delete;
  native_escrow& operator=( native_escrow&& )      = delete;

  std::error_code
  receive( system_interface& system, const protocol::account& from, const protocol::amount& value ) override;
  std::error_code
  release( system_interface& system, const protocol::account& to, const protocol::amount& value ) override;

  result< protocol::amount > balance_of( system_interface& system, const protocol::account& account ) const;
  std::error_code fund( system_interface& system, const protocol::account& account, const protocol::amount& value );

  const protocol::account& custodian() const noexcept;

  void reject( const protocol::account& account );
  void accept( const protocol::account& account );
  void on_release( release_hook hook );

private:
  std::error_code
  move( system_interface& system, const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  protocol::account _custodian;
  std::set< protocol::account > _rejecting;
  release_hook _hook;
};

} // namespace custodia::token
