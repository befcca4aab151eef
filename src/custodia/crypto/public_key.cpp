#include <custodia/crypto/public_key.hpp>
#include <custodia/memory.hpp>

#include <algorithm>
#include <cassert>

#include <sodium.h>

namespace custodia::crypto {

static void initialize_crypto()
{
  [[maybe_unused]]
  static int retval = sodium_init();
  assert( retval >= 0 );
}

public_key::public_key( const public_key_data& pkd ) noexcept:
    _bytes( pkd )
{
  initialize_crypto();
}

bool public_key::operator==( const public_key& rhs ) const noexcept
{
  return std::ranges::equal( _bytes, rhs._bytes );
}

bool public_key::operator!=( const public_key& rhs ) const noexcept
{
  return !( *this == rhs );
}

bool public_key::verify( const signature& sig, const digest& dig ) const noexcept
{
  return !crypto_sign_verify_detached( memory::pointer_cast< const unsigned char* >( sig.data() ),
                                       memory::pointer_cast< const unsigned char* >( dig.data() ),
                                       dig.size(),
                                       memory::pointer_cast< const unsigned char* >( _bytes.data() ) );
}

bool public_key::valid() const noexcept
{
  return crypto_core_ed25519_is_valid_point( memory::pointer_cast< const unsigned char* >( _bytes.data() ) ) == 1;
}

const public_key_data& public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace custodia::crypto
