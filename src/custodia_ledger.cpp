#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <custodia/controller.hpp>
#include <custodia/crypto.hpp>
#include <custodia/encode.hpp>
#include <custodia/log.hpp>
#include <custodia/protocol.hpp>
#include <custodia/token.hpp>

namespace constants {

using namespace std::string_literals;

const auto service = "ledger"s;

const auto help_option          = "help,h"s;
const auto version_option       = "version,v"s;
const auto basedir_option       = "basedir,d"s;
const auto basedir_default      = ".custodia"s;
const auto log_level_option     = "log-level,l"s;
const auto log_level_default    = "info"s;
const auto name_option          = "name,n"s;
const auto symbol_option        = "symbol,s"s;
const auto decimals_option      = "decimals"s;
const auto token_version_option = "token-version"s;
const auto network_option       = "network"s;
const auto network_default      = "custodia"s;
const auto now_option           = "now"s;

constexpr std::uint32_t max_decimals = 77;

} // namespace constants

using namespace boost;
using namespace custodia;

namespace {

std::string option_name( const std::string& option )
{
  return option.substr( 0, option.find( ',' ) );
}

template< typename T >
T get_option( const std::string& option,
              const T& default_value,
              const program_options::variables_map& args,
              const YAML::Node& service_config,
              const YAML::Node& global_config )
{
  const auto key = option_name( option );

  if( args.count( key ) )
    return args[ key ].as< T >();

  if( service_config && service_config[ key ] )
    return service_config[ key ].as< T >();

  if( global_config && global_config[ key ] )
    return global_config[ key ].as< T >();

  return default_value;
}

protocol::account parse_account( const std::string& value, const token::descriptor& desc )
{
  if( value == "self" )
    return desc.self;

  if( value.starts_with( '@' ) )
    return protocol::user_account(
      crypto::secret_key::create( crypto::hash( std::string_view( value ).substr( 1 ) ) ).public_key() );

  auto account = protocol::account_from_hex( value );
  if( !account )
    throw std::runtime_error( "invalid account '" + value + "': " + account.error().message() );

  return *account;
}

protocol::amount parse_amount( const std::string& value )
{
  try
  {
    return protocol::amount( multiprecision::checked_uint256_t( value.c_str() ) );
  }
  catch( const std::exception& e )
  {
    throw std::runtime_error( "invalid amount '" + value + "': " + e.what() );
  }
}

/**
 * Apply one operation described by a YAML node. Accounts are hex strings,
 * `@name` for the user account of the key seeded by `name`, or `self` for the
 * ledger account.
 */
std::error_code replay( controller::controller& ctl,
                        const YAML::Node& op,
                        const token::descriptor& desc,
                        std::uint64_t now )
{
  const auto kind = op[ "op" ].as< std::string >();

  auto account = [ & ]( const char* field )
  {
    return parse_account( op[ field ].as< std::string >(), desc );
  };

  auto value = [ & ]()
  {
    return parse_amount( op[ "amount" ].as< std::string >() );
  };

  if( kind == "deposit" )
    return ctl.deposit( account( "caller" ), value() );
  if( kind == "deposit_to" )
    return ctl.deposit_to( account( "caller" ), account( "to" ), value() );
  if( kind == "receive" )
    return ctl.receive( account( "caller" ), value() );
  if( kind == "withdraw" )
    return ctl.withdraw( account( "caller" ), value() );
  if( kind == "withdraw_to" )
    return ctl.withdraw_to( account( "caller" ), account( "to" ), value() );
  if( kind == "withdraw_from" )
    return ctl.withdraw_from( account( "caller" ), account( "from" ), account( "to" ), value() );
  if( kind == "transfer" )
    return ctl.transfer( account( "caller" ), account( "to" ), value() );
  if( kind == "transfer_from" )
    return ctl.transfer_from( account( "caller" ), account( "from" ), account( "to" ), value() );
  if( kind == "approve" )
    return ctl.approve( account( "caller" ), account( "spender" ), value() );

  if( kind == "permit" )
  {
    const auto signer = op[ "signer" ] ? op[ "signer" ].as< std::string >() : op[ "owner" ].as< std::string >();
    if( !signer.starts_with( '@' ) )
      throw std::runtime_error( "permit signer must be a seeded account" );

    const auto owner    = account( "owner" );
    const auto spender  = account( "spender" );
    const auto amount   = value();
    const auto deadline = op[ "deadline" ] ? op[ "deadline" ].as< std::uint64_t >() : now;

    auto digest = ctl.permit_digest( owner, spender, amount, deadline );
    if( !digest )
      return digest.error();

    auto key = crypto::secret_key::create( crypto::hash( std::string_view( signer ).substr( 1 ) ) );
    return ctl.permit( owner, spender, amount, deadline, key.sign_recoverable( *digest ), now );
  }

  throw std::runtime_error( "unknown operation '" + kind + "'" );
}

} // namespace

const std::string& version_string();

int main( int argc, char** argv )
{
  std::string log_level, network;
  std::uint64_t now = 0;
  token::descriptor desc;
  controller::state::genesis_data genesis_data;
  std::vector< protocol::account > genesis_accounts;
  YAML::Node transactions;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()         , "Print this help message and exit" )
      ( constants::version_option.data()      , "Print version string and exit" )
      ( constants::basedir_option.data()      , program_options::value< std::string >()->default_value( constants::basedir_default ), "Ledger base directory" )
      ( constants::log_level_option.data()    , program_options::value< std::string >()  , "The log filtering level" )
      ( constants::name_option.data()         , program_options::value< std::string >()  , "The name of the ledger's unit" )
      ( constants::symbol_option.data()       , program_options::value< std::string >()  , "The symbol of the ledger's unit" )
      ( constants::decimals_option.data()     , program_options::value< std::uint32_t >(), "The number of decimals of the ledger's unit" )
      ( constants::token_version_option.data(), program_options::value< std::string >()  , "The version tag bound into signed permits" )
      ( constants::network_option.data()      , program_options::value< std::string >()  , "The network the ledger is deployed on" )
      ( constants::now_option.data()          , program_options::value< std::uint64_t >(), "The unix time in seconds used to check permit deadlines" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( option_name( constants::help_option ) ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( option_name( constants::version_option ) ) )
    {
      std::cout << version_string() << "\n";
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ option_name( constants::basedir_option ) ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node ledger_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
    {
      yaml_config = basedir / "config.yaml";
    }

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ "global" ];
      ledger_config = config[ constants::service ];
    }

    const auto system_now = static_cast< std::uint64_t >(
      std::chrono::duration_cast< std::chrono::seconds >( std::chrono::system_clock::now().time_since_epoch() ).count() );

    // clang-format off
    log_level     = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, ledger_config, global_config );
    desc.name     = get_option< std::string >( constants::name_option, desc.name, args, ledger_config, global_config );
    desc.symbol   = get_option< std::string >( constants::symbol_option, desc.symbol, args, ledger_config, global_config );
    auto decimals = get_option< std::uint32_t >( constants::decimals_option, desc.decimals, args, ledger_config, global_config );
    desc.version  = get_option< std::string >( constants::token_version_option, desc.version, args, ledger_config, global_config );
    network       = get_option< std::string >( constants::network_option, constants::network_default, args, ledger_config, global_config );
    now           = get_option< std::uint64_t >( constants::now_option, system_now, args, ledger_config, global_config );
    // clang-format on

    log::initialize( log_level );

    LOG_INFO( log::instance(), "{}", version_string() );

    if( config.IsNull() )
    {
      LOG_WARNING( log::instance(), "Could not find config (config.yml or config.yaml expected). Using default values" );
    }

    if( decimals > constants::max_decimals )
      throw std::runtime_error( "decimals must not exceed " + std::to_string( constants::max_decimals ) );

    desc.decimals   = static_cast< std::uint8_t >( decimals );
    desc.network_id = crypto::hash( network );

    if( ledger_config && ledger_config[ "genesis" ] )
    {
      for( const auto& entry: ledger_config[ "genesis" ] )
      {
        auto account = parse_account( entry.first.as< std::string >(), desc );
        auto balance = parse_amount( entry.second.as< std::string >() );
        genesis_data.emplace_back( controller::state::native_balance( account, balance ) );
        genesis_accounts.push_back( account );
      }
    }

    if( ledger_config && ledger_config[ "transactions" ] )
      transactions = ledger_config[ "transactions" ];

    LOG_INFO( log::instance(), "Ledger: {} ({}), decimals: {}", desc.name, desc.symbol, decimals );
    LOG_INFO( log::instance(), "Network: {}", network );
    LOG_INFO( log::instance(), "Genesis accounts: {}", genesis_accounts.size() );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller ctl( desc, std::make_shared< token::native_escrow >( desc.self ) );

  try
  {
    ctl.open( genesis_data );

    std::size_t index = 0;
    for( const auto& op: transactions )
    {
      auto error = replay( ctl, op, desc, now );
      if( error )
        LOG_INFO( log::instance(), "Operation {} ({}) reverted: {}", index, op[ "op" ].as< std::string >(), error.message() );
      else
        LOG_INFO( log::instance(), "Operation {} ({}) applied", index, op[ "op" ].as< std::string >() );

      ++index;
    }

    for( const auto& account: genesis_accounts )
    {
      LOG_INFO( log::instance(),
                "Account {} - balance: {}, native balance: {}, nonce: {}",
                log::hex{ account.data(), account.size() },
                ctl.balance_of( account ).value().str(),
                ctl.native_balance_of( account ).value().str(),
                ctl.nonce_of( account ).value() );
    }

    LOG_INFO( log::instance(),
              "Total supply: {}, escrowed: {}, events: {}, revision: {}",
              ctl.total_supply().value().str(),
              ctl.native_balance_of( ctl.account() ).value().str(),
              ctl.events().size(),
              ctl.revision() );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  ctl.close();

  LOG_INFO( log::instance(), "Shut down gracefully" );

  return retcode;
}

const std::string& version_string()
{
  static const std::string v_str = "Custodia Ledger v" CUSTODIA_VERSION;
  return v_str;
}
