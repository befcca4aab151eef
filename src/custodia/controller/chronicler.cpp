#include <custodia/controller/chronicler.hpp>

#include <stdexcept>

namespace custodia::controller {

void chronicler_session::push_event( protocol::event_data&& data )
{
  _events.emplace_back( std::move( data ) );
}

std::vector< protocol::event_data >& chronicler_session::events() noexcept
{
  return _events;
}

chronicler::chronicler( const protocol::account& source ) noexcept:
    _source( source )
{}

std::shared_ptr< chronicler_session > chronicler::make_session()
{
  return _sessions.emplace_back( std::make_shared< chronicler_session >() );
}

void chronicler::commit( const std::shared_ptr< chronicler_session >& session )
{
  pop_session( session );

  for( auto& data: session->events() )
  {
    if( _sessions.empty() )
      record( std::move( data ) );
    else
      _sessions.back()->push_event( std::move( data ) );
  }

  session->events().clear();
}

void chronicler::discard( const std::shared_ptr< chronicler_session >& session )
{
  pop_session( session );
  session->events().clear();
}

void chronicler::push_event( protocol::event_data&& data )
{
  if( _sessions.empty() )
    record( std::move( data ) );
  else
    _sessions.back()->push_event( std::move( data ) );
}

const std::vector< protocol::event >& chronicler::events() const noexcept
{
  return _events;
}

void chronicler::pop_session( const std::shared_ptr< chronicler_session >& session )
{
  if( _sessions.empty() || _sessions.back() != session )
    throw std::runtime_error( "chronicler session is not the innermost session" );

  _sessions.pop_back();
}

void chronicler::record( protocol::event_data&& data )
{
  auto& e    = _events.emplace_back();
  e.sequence = static_cast< std::uint32_t >( _events.size() - 1 );
  e.source   = _source;
  e.impacted = protocol::impacted_accounts( data );
  e.data     = std::move( data );
}

} // namespace custodia::controller
