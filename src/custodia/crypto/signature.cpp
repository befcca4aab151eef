#include <custodia/crypto/signature.hpp>

#include <algorithm>

namespace custodia::crypto {

result< public_key_data > recover( const recoverable_signature& sig, const digest& dig ) noexcept
{
  signature signature_bytes;
  public_key_data key_bytes;

  std::ranges::copy( std::span( sig ).first< signature_length >(), signature_bytes.begin() );
  std::ranges::copy( std::span( sig ).last< public_key_length >(), key_bytes.begin() );

  public_key key( key_bytes );

  if( !key.valid() )
    return std::unexpected( crypto_errc::malformed_signature );

  if( key.verify( signature_bytes, dig ) )
    return key_bytes;

  hasher_reset();
  hasher_update( dig );
  hasher_update( sig );
  return hasher_finalize();
}

} // namespace custodia::crypto
