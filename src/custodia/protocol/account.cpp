#include <custodia/protocol/account.hpp>

#include <algorithm>

namespace custodia::protocol {

account user_account( const crypto::public_key& key ) noexcept
{
  return user_account( key.bytes() );
}

account user_account( const crypto::public_key_data& key ) noexcept
{
  account a;
  std::ranges::copy( key, a.begin() );
  return a;
}

account program_account( std::string_view name ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( std::string_view( "program" ) );
  crypto::hasher_update( name );
  return crypto::hasher_finalize();
}

bool is_null( const account& a ) noexcept
{
  return a == null_account;
}

encode::result< account > account_from_hex( std::string_view sv ) noexcept
{
  return encode::from_hex< account_length >( sv );
}

} // namespace custodia::protocol
