#include <custodia/protocol/permit.hpp>

#include <string_view>

namespace custodia::protocol {

using namespace std::string_view_literals;

constexpr auto domain_type =
  "Domain(string name,string version,bytes32 networkId,bytes32 verifyingLedger)"sv;
constexpr auto permit_type =
  "Permit(bytes32 owner,bytes32 spender,uint256 value,uint64 nonce,uint64 deadline)"sv;
constexpr auto digest_prefix = "\x19\x01"sv;

crypto::digest make_domain_separator( const domain& d ) noexcept
{
  const auto type_hash    = crypto::hash( domain_type );
  const auto name_hash    = crypto::hash( d.name );
  const auto version_hash = crypto::hash( d.version );

  crypto::hasher_reset();
  crypto::hasher_update( type_hash );
  crypto::hasher_update( name_hash );
  crypto::hasher_update( version_hash );
  crypto::hasher_update( d.network_id );
  crypto::hasher_update( d.verifying_ledger );
  return crypto::hasher_finalize();
}

crypto::digest make_struct_hash( const permit& p )
{
  const auto type_hash = crypto::hash( permit_type );
  const auto value     = to_bytes( p.value );

  crypto::hasher_reset();
  crypto::hasher_update( type_hash );
  crypto::hasher_update( p.owner );
  crypto::hasher_update( p.spender );
  crypto::hasher_update( value );
  crypto::hasher_update( p.nonce );
  crypto::hasher_update( p.deadline );
  return crypto::hasher_finalize();
}

crypto::digest make_digest( const domain& d, const permit& p )
{
  const auto domain_separator = make_domain_separator( d );
  const auto struct_hash      = make_struct_hash( p );

  crypto::hasher_reset();
  crypto::hasher_update( digest_prefix );
  crypto::hasher_update( domain_separator );
  crypto::hasher_update( struct_hash );
  return crypto::hasher_finalize();
}

} // namespace custodia::protocol
