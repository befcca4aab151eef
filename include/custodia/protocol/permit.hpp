#pragma once

#include <cstdint>
#include <string>

#include <custodia/crypto.hpp>
#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>

namespace custodia::protocol {

/**
 * Parameters that bind a signed message to one ledger on one network.
 */
struct domain
{
  std::string name;
  std::string version;
  crypto::digest network_id{};
  account verifying_ledger{};
};

/**
 * An owner's intent to set the allowance of a spender. The deadline is a unix
 * timestamp in seconds and is inclusive.
 */
struct permit
{
  account owner{};
  account spender{};
  amount value;
  std::uint64_t nonce    = 0;
  std::uint64_t deadline = 0;
};

crypto::digest make_domain_separator( const domain& d ) noexcept;
crypto::digest make_struct_hash( const permit& p );

/**
 * The digest an owner signs: a fixed prefix, the domain separator and the
 * struct hash, in that order.
 */
crypto::digest make_digest( const domain& d, const permit& p );

} // namespace custodia::protocol
