#include <custodia/token/delegated_authorization.hpp>
#include <custodia/token/state.hpp>

#include <limits>

#include <boost/endian.hpp>

#include <custodia/log.hpp>
#include <custodia/memory.hpp>

namespace custodia::token {

delegated_authorization::delegated_authorization( system_interface& system,
                                                  const descriptor& desc,
                                                  allowance_table& allowances ) noexcept:
    _system( system ),
    _desc( desc ),
    _allowances( allowances )
{}

result< std::uint64_t > delegated_authorization::nonce_of( const protocol::account& owner ) const
{
  auto object = _system.get_object( state::space::nonce( _desc.self ), owner );
  if( !object )
    return std::unexpected( object.error() );

  if( object->empty() )
    return 0;

  if( object->size() != sizeof( std::uint64_t ) )
    return std::unexpected( token_errc::unexpected_object );

  auto nonce = memory::bit_cast< std::uint64_t >( *object );
  boost::endian::little_to_native_inplace( nonce );
  return nonce;
}

crypto::digest delegated_authorization::domain_separator() const
{
  return protocol::make_domain_separator( make_domain( _desc ) );
}

result< crypto::digest > delegated_authorization::digest( const protocol::account& owner,
                                                          const protocol::account& spender,
                                                          const protocol::amount& value,
                                                          std::uint64_t deadline ) const
{
  auto nonce = nonce_of( owner );
  if( !nonce )
    return std::unexpected( nonce.error() );

  return protocol::make_digest(
    make_domain( _desc ),
    protocol::permit{ .owner = owner, .spender = spender, .value = value, .nonce = *nonce, .deadline = deadline } );
}

result< protocol::account > delegated_authorization::recover_signer( const protocol::account& owner,
                                                                     const protocol::account& spender,
                                                                     const protocol::amount& value,
                                                                     std::uint64_t deadline,
                                                                     const crypto::recoverable_signature& signature ) const
{
  auto dig = digest( owner, spender, value, deadline );
  if( !dig )
    return std::unexpected( dig.error() );

  auto signer = crypto::recover( signature, *dig );
  if( !signer )
    return std::unexpected( token_errc::invalid_signature );

  return protocol::user_account( *signer );
}

std::error_code delegated_authorization::permit( const protocol::account& owner,
                                                 const protocol::account& spender,
                                                 const protocol::amount& value,
                                                 std::uint64_t deadline,
                                                 const crypto::recoverable_signature& signature,
                                                 std::uint64_t now )
{
  if( now > deadline )
    return token_errc::expired_authorization;

  auto nonce = nonce_of( owner );
  if( !nonce )
    return nonce.error();

  auto signer = recover_signer( owner, spender, value, deadline, signature );
  if( !signer )
    return signer.error();

  if( *signer != owner )
  {
    LOG_DEBUG( log::instance(),
               "Permit signer {} does not match owner {}",
               log::hex{ signer->data(), signer->size() },
               log::hex{ owner.data(), owner.size() } );
    return token_errc::signer_mismatch;
  }

  if( auto error = increment_nonce( owner, *nonce ); error )
    return error;

  return _allowances.approve( owner, spender, value );
}

std::error_code delegated_authorization::increment_nonce( const protocol::account& owner, std::uint64_t nonce )
{
  if( nonce == std::numeric_limits< std::uint64_t >::max() )
    return token_errc::overflow;

  auto next = boost::endian::native_to_little( nonce + 1 );
  return _system.put_object( state::space::nonce( _desc.self ), owner, memory::as_bytes( next ) );
}

} // namespace custodia::token
