// NOLINTBEGIN

#include <test/fixture.hpp>

#include <custodia/controller.hpp>
#include <custodia/crypto.hpp>
#include <custodia/encode.hpp>
#include <custodia/log.hpp>
#include <custodia/protocol.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  custodia::log::initialize( log_level );

  _descriptor.network_id = custodia::crypto::hash( name );
  _escrow                = std::make_shared< custodia::token::native_escrow >( _descriptor.self );
  _controller            = std::make_unique< custodia::controller::controller >( _descriptor, _escrow );

  for( const auto& account_name: { "alice", "bob", "charlie" } )
  {
    auto account = make_account( account_name );
    _accounts.push_back( account );
    _genesis_data.emplace_back( custodia::controller::state::native_balance( account, genesis_native_balance ) );
  }

  LOG_INFO( custodia::log::instance(), "Funded {} accounts for {}", _accounts.size(), name );

  _controller->open( _genesis_data );
}

fixture::~fixture()
{
  _controller->close();
}

custodia::crypto::secret_key fixture::make_secret_key( const std::string& name )
{
  return custodia::crypto::secret_key::create( custodia::crypto::hash( name ) );
}

custodia::protocol::account fixture::make_account( const std::string& name )
{
  return custodia::protocol::user_account( make_secret_key( name ).public_key() );
}

custodia::crypto::recoverable_signature fixture::sign_permit( const custodia::crypto::secret_key& signer,
                                                              const custodia::protocol::account& owner,
                                                              const custodia::protocol::account& spender,
                                                              const custodia::protocol::amount& value,
                                                              std::uint64_t deadline ) const
{
  auto digest = _controller->permit_digest( owner, spender, value, deadline );
  if( !digest )
  {
    LOG_ERROR( custodia::log::instance(), "Could not compute permit digest: {}", digest.error().message() );
    return {};
  }

  return signer.sign_recoverable( *digest );
}

bool fixture::verify( std::error_code code ) const
{
  if( code )
  {
    LOG_ERROR( custodia::log::instance(), "Operation has failed with: {}", code.message() );
    return false;
  }

  return true;
}

bool fixture::conserved() const
{
  auto supply  = _controller->total_supply();
  auto escrowed = _controller->native_balance_of( _controller->account() );

  if( !supply || !escrowed )
    return false;

  custodia::protocol::amount sum = 0;
  for( const auto& account: _accounts )
  {
    auto balance = _controller->balance_of( account );
    if( !balance )
      return false;

    sum += *balance;
  }

  if( *supply != sum || *supply != *escrowed )
  {
    LOG_ERROR( custodia::log::instance(),
               "Supply {} does not match balances {} and escrow {}",
               supply->str(),
               sum.str(),
               escrowed->str() );
    return false;
  }

  return true;
}

} // namespace test

// NOLINTEND
