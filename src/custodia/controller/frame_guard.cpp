#include <custodia/controller/frame_guard.hpp>

namespace custodia::controller {

frame_guard::frame_guard( std::vector< state_db::temporary_state_node_ptr >& nodes,
                          chronicler& events,
                          const std::shared_ptr< chronicler_session >& session ) noexcept:
    _nodes( nodes ),
    _chronicler( events ),
    _session( session )
{}

frame_guard::~frame_guard()
{
  if( _active )
  {
    _nodes.pop_back();
    _chronicler.discard( _session );
  }
}

void frame_guard::commit()
{
  // The frame stays active until the squash succeeds
  _nodes.back()->squash();
  _nodes.pop_back();
  _active = false;

  _chronicler.commit( _session );
}

} // namespace custodia::controller
