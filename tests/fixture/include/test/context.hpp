#pragma once

#include <memory>
#include <string>

#include <custodia/controller.hpp>
#include <custodia/crypto.hpp>
#include <custodia/protocol.hpp>
#include <custodia/state_db.hpp>
#include <custodia/token.hpp>

namespace test {

/**
 * A state database with an execution context over its root, for driving token
 * components without a controller.
 */
struct context
{
  context( const context& )            = delete;
  context( context&& )                 = delete;
  context& operator=( const context& ) = delete;
  context& operator=( context&& )      = delete;

  context():
      _chronicler( _desc.self )
  {
    _db.open( {} );
    _context = std::make_unique< custodia::controller::execution_context >( _db.root(), _chronicler );
  }

  ~context() = default;

  static custodia::protocol::account account( const std::string& name )
  {
    return custodia::protocol::user_account( key( name ).public_key() );
  }

  static custodia::crypto::secret_key key( const std::string& name )
  {
    return custodia::crypto::secret_key::create( custodia::crypto::hash( name ) );
  }

  custodia::token::system_interface& system()
  {
    return *_context;
  }

  const std::vector< custodia::protocol::event >& events() const
  {
    return _chronicler.events();
  }

  custodia::token::descriptor _desc;
  custodia::state_db::database _db;
  custodia::controller::chronicler _chronicler;
  std::unique_ptr< custodia::controller::execution_context > _context;
};

} // namespace test
