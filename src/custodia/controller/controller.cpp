#include <custodia/controller/controller.hpp>
#include <custodia/controller/execution_context.hpp>
#include <custodia/controller/state.hpp>

#include <custodia/encode.hpp>
#include <custodia/log.hpp>

#include <memory>
#include <stdexcept>

namespace custodia::controller {

/**
 * The token components of one operation, bound to the context it runs in.
 */
struct controller::components
{
  components( token::system_interface& system, const token::descriptor& desc, token::asset_escrow& escrow ):
      ledger( system, desc.self ),
      allowances( system, desc.self ),
      permits( system, desc, allowances ),
      guard( ledger, allowances ),
      exchange( system, escrow, ledger, allowances )
  {}

  token::ledger ledger;
  token::allowance_table allowances;
  token::delegated_authorization permits;
  token::transfer_guard guard;
  token::deposit_withdraw exchange;
};

template< typename T >
result< T > controller::read( const std::function< result< T >( components& ) >& query ) const
{
  components c( context(), _desc, *_escrow );
  return query( c );
}

controller::controller( const token::descriptor& desc, const std::shared_ptr< token::asset_escrow >& escrow ):
    _desc( desc ),
    _escrow( escrow ),
    _chronicler( desc.self )
{
  if( !_escrow )
    throw std::runtime_error( "controller requires an asset escrow" );
}

controller::~controller()
{
  close();
}

void controller::open( const state::genesis_data& data )
{
  const auto escrow_key = state_db::make_compound_key( token::state::space::native_balance(), _desc.self );
  for( const auto& entry: data )
  {
    if( state_db::make_compound_key( entry.space, entry.key ) == escrow_key )
      throw std::runtime_error( "genesis data must not hold native asset for the ledger account" );
  }

  _db.open(
    [ & ]( const state_db::state_node_ptr& root )
    {
      for( const auto& entry: data )
      {
        if( root->get( entry.space, entry.key ) )
          throw std::runtime_error( "encountered unexpected object in initial state" );

        root->put( entry.space, entry.key, entry.value );
      }
      LOG_INFO( custodia::log::instance(), "Wrote {} genesis objects into new database", data.size() );
    } );

  _context = std::make_unique< execution_context >( _db.root(), _chronicler );

  LOG_INFO( custodia::log::instance(),
            "Opened ledger {} ({}) at revision {}, account: {}",
            _desc.name,
            _desc.symbol,
            _db.root()->revision(),
            custodia::log::hex{ _desc.self.data(), _desc.self.size() } );
}

void controller::close()
{
  _context.reset();
  _db.close();
}

std::error_code controller::deposit( const protocol::account& caller, const protocol::amount& value )
{
  return run( "deposit",
              [ & ]( components& c )
              {
                return c.exchange.deposit( caller, value );
              } );
}

std::error_code controller::deposit_to( const protocol::account& caller,
                                        const protocol::account& recipient,
                                        const protocol::amount& value )
{
  return run( "deposit_to",
              [ & ]( components& c )
              {
                return c.exchange.deposit_to( caller, recipient, value );
              } );
}

std::error_code controller::receive( const protocol::account& caller, const protocol::amount& value )
{
  return run( "receive",
              [ & ]( components& c )
              {
                return c.exchange.deposit( caller, value );
              } );
}

std::error_code controller::withdraw( const protocol::account& caller, const protocol::amount& value )
{
  return run( "withdraw",
              [ & ]( components& c )
              {
                return c.exchange.withdraw( caller, value );
              } );
}

std::error_code controller::withdraw_to( const protocol::account& caller,
                                         const protocol::account& recipient,
                                         const protocol::amount& value )
{
  return run( "withdraw_to",
              [ & ]( components& c )
              {
                return c.exchange.withdraw_to( caller, recipient, value );
              } );
}

std::error_code controller::withdraw_from( const protocol::account& caller,
                                           const protocol::account& owner,
                                           const protocol::account& recipient,
                                           const protocol::amount& value )
{
  return run( "withdraw_from",
              [ & ]( components& c )
              {
                return c.exchange.withdraw_from( caller, owner, recipient, value );
              } );
}

std::error_code
controller::transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  return run( "transfer",
              [ & ]( components& c )
              {
                return c.guard.transfer( caller, to, value );
              } );
}

std::error_code controller::transfer_from( const protocol::account& caller,
                                           const protocol::account& from,
                                           const protocol::account& to,
                                           const protocol::amount& value )
{
  return run( "transfer_from",
              [ & ]( components& c )
              {
                return c.guard.transfer_from( caller, from, to, value );
              } );
}

std::error_code
controller::approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value )
{
  return run( "approve",
              [ & ]( components& c )
              {
                return c.allowances.approve( caller, spender, value );
              } );
}

std::error_code controller::permit( const protocol::account& owner,
                                    const protocol::account& spender,
                                    const protocol::amount& value,
                                    std::uint64_t deadline,
                                    const crypto::recoverable_signature& signature,
                                    std::uint64_t now )
{
  return run( "permit",
              [ & ]( components& c )
              {
                return c.permits.permit( owner, spender, value, deadline, signature, now );
              } );
}

result< protocol::amount > controller::balance_of( const protocol::account& account ) const
{
  return read< protocol::amount >(
    [ & ]( components& c )
    {
      return c.ledger.balance_of( account );
    } );
}

result< protocol::amount > controller::allowance( const protocol::account& owner,
                                                  const protocol::account& spender ) const
{
  return read< protocol::amount >(
    [ & ]( components& c )
    {
      return c.allowances.allowance( owner, spender );
    } );
}

result< protocol::amount > controller::total_supply() const
{
  return read< protocol::amount >(
    []( components& c )
    {
      return c.ledger.total_supply();
    } );
}

result< std::uint64_t > controller::nonce_of( const protocol::account& owner ) const
{
  return read< std::uint64_t >(
    [ & ]( components& c )
    {
      return c.permits.nonce_of( owner );
    } );
}

result< protocol::amount > controller::native_balance_of( const protocol::account& account ) const
{
  return token::state::get_amount( context(), token::state::space::native_balance(), account );
}

result< crypto::digest > controller::permit_digest( const protocol::account& owner,
                                                    const protocol::account& spender,
                                                    const protocol::amount& value,
                                                    std::uint64_t deadline ) const
{
  return read< crypto::digest >(
    [ & ]( components& c )
    {
      return c.permits.digest( owner, spender, value, deadline );
    } );
}

result< protocol::account > controller::recover_signer( const protocol::account& owner,
                                                        const protocol::account& spender,
                                                        const protocol::amount& value,
                                                        std::uint64_t deadline,
                                                        const crypto::recoverable_signature& signature ) const
{
  return read< protocol::account >(
    [ & ]( components& c )
    {
      return c.permits.recover_signer( owner, spender, value, deadline, signature );
    } );
}

const std::string& controller::name() const noexcept
{
  return _desc.name;
}

const std::string& controller::symbol() const noexcept
{
  return _desc.symbol;
}

std::uint8_t controller::decimals() const noexcept
{
  return _desc.decimals;
}

crypto::digest controller::domain_separator() const
{
  return protocol::make_domain_separator( token::make_domain( _desc ) );
}

const protocol::account& controller::account() const noexcept
{
  return _desc.self;
}

const std::vector< protocol::event >& controller::events() const noexcept
{
  return _chronicler.events();
}

std::uint64_t controller::revision() const
{
  return _db.root()->revision();
}

std::error_code controller::run( std::string_view name, const std::function< std::error_code( components& ) >& op )
{
  auto& ctx = context();

  auto error = ctx.apply(
    [ & ]( execution_context& system )
    {
      components c( system, _desc, *_escrow );
      return op( c );
    } );

  if( error )
    LOG_DEBUG( custodia::log::instance(),
               "Reverted {} at depth {}: {}",
               name,
               ctx.depth() + 1,
               error.message() );

  return error;
}

execution_context& controller::context() const
{
  if( !_context )
    throw std::runtime_error( "controller is not open" );

  return *_context;
}

} // namespace custodia::controller
