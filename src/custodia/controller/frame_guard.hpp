#pragma once

#include <custodia/controller/chronicler.hpp>
#include <custodia/state_db.hpp>

#include <memory>
#include <vector>

namespace custodia::controller {

/**
 * Owns the innermost operation frame: the top node of `nodes` and the event
 * session opened with it. Unless committed, the frame is popped and its
 * events discarded on destruction, including when the operation or the
 * commit itself throws.
 */
class frame_guard final
{
public:
  frame_guard( std::vector< state_db::temporary_state_node_ptr >& nodes,
               chronicler& events,
               const std::shared_ptr< chronicler_session >& session ) noexcept;

  frame_guard( const frame_guard& ) = delete;
  frame_guard( frame_guard&& )      = delete;

  ~frame_guard();

  frame_guard& operator=( const frame_guard& ) = delete;
  frame_guard& operator=( frame_guard&& )      = delete;

  void commit();

private:
  std::vector< state_db::temporary_state_node_ptr >& _nodes;
  chronicler& _chronicler;
  std::shared_ptr< chronicler_session > _session;
  bool _active = true;
};

} // namespace custodia::controller
