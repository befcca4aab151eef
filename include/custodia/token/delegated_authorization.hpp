#pragma once

#include <cstdint>

#include <custodia/crypto.hpp>
#include <custodia/protocol.hpp>
#include <custodia/token/allowance_table.hpp>
#include <custodia/token/descriptor.hpp>
#include <custodia/token/error.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::token {

/**
 * Sets allowances on behalf of an owner who signed a permit off ledger. Each
 * owner has a nonce that is bound into the signed digest and advanced by every
 * accepted permit, so a permit can be used at most once.
 */
class delegated_authorization final
{
public:
  delegated_authorization( system_interface& system, const descriptor& desc, allowance_table& allowances ) noexcept;
  delegated_authorization( const delegated_authorization& ) = delete;
  delegated_authorization( delegated_authorization&& )      = delete;
  ~delegated_authorization()                                = default;

  delegated_authorization& operator=( const delegated_authorization& ) = delete;
  delegated_authorization& operator=( delegated_authorization&& )      = delete;

  result< std::uint64_t > nonce_of( const protocol::account& owner ) const;
  crypto::digest domain_separator() const;

  /**
   * The digest an owner must sign to authorize the permit at their current
   * nonce.
   */
  result< crypto::digest > digest( const protocol::account& owner,
                                   const protocol::account& spender,
                                   const protocol::amount& value,
                                   std::uint64_t deadline ) const;

  /**
   * The account that signed the permit at the owner's current nonce.
   */
  result< protocol::account > recover_signer( const protocol::account& owner,
                                              const protocol::account& spender,
                                              const protocol::amount& value,
                                              std::uint64_t deadline,
                                              const crypto::recoverable_signature& signature ) const;

  /**
   * Verify the permit and approve `value` for `spender`. A deadline is
   * inclusive: a permit whose deadline equals `now` is accepted.
   */
  std::error_code permit( const protocol::account& owner,
                          const protocol::account& spender,
                          const protocol::amount& value,
                          std::uint64_t deadline,
                          const crypto::recoverable_signature& signature,
                          std::uint64_t now );

private:
  std::error_code increment_nonce( const protocol::account& owner, std::uint64_t nonce );

  system_interface& _system;
  const descriptor& _desc;
  allowance_table& _allowances;
};

} // namespace custodia::token
