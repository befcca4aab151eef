#include <custodia/token/descriptor.hpp>

namespace custodia::token {

protocol::domain make_domain( const descriptor& desc )
{
  return protocol::domain{ .name             = desc.name,
                           .version          = desc.version,
                           .network_id       = desc.network_id,
                           .verifying_ledger = desc.self };
}

} // namespace custodia::token
