#pragma once

#include <memory>
#include <vector>

#include <custodia/protocol.hpp>

namespace custodia::controller {

class chronicler_session
{
public:
  void push_event( protocol::event_data&& data );
  std::vector< protocol::event_data >& events() noexcept;

private:
  std::vector< protocol::event_data > _events;
};

/**
 * Records the events of committed operations. Events of an operation in flight
 * are held in its session until the operation is committed or discarded.
 * Sessions nest: committing an inner session hands its events to the session
 * that encloses it.
 */
class chronicler final
{
public:
  chronicler( const protocol::account& source ) noexcept;

  std::shared_ptr< chronicler_session > make_session();
  void commit( const std::shared_ptr< chronicler_session >& session );
  void discard( const std::shared_ptr< chronicler_session >& session );

  void push_event( protocol::event_data&& data );
  const std::vector< protocol::event >& events() const noexcept;

private:
  void pop_session( const std::shared_ptr< chronicler_session >& session );
  void record( protocol::event_data&& data );

  protocol::account _source;
  std::vector< std::shared_ptr< chronicler_session > > _sessions;
  std::vector< protocol::event > _events;
};

} // namespace custodia::controller
