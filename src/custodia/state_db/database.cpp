#include <custodia/state_db/database.hpp>

#include <stdexcept>

namespace custodia::state_db {

database::~database()
{
  close();
}

void database::open( genesis_init_function init )
{
  _init = std::move( init );
  _root = std::make_shared< permanent_state_node >( std::make_shared< state_delta >() );

  if( _init )
  {
    state_node_ptr root = _root;
    _init( root );
  }
}

void database::close()
{
  _root.reset();
}

void database::reset()
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  open( std::move( _init ) );
}

permanent_state_node_ptr database::root() const
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  return _root;
}

} // namespace custodia::state_db
