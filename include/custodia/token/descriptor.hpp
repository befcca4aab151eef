#pragma once

#include <cstdint>
#include <string>

#include <custodia/crypto/hash.hpp>
#include <custodia/protocol/account.hpp>
#include <custodia/protocol/permit.hpp>

namespace custodia::token {

struct descriptor
{
  std::string name       = "Wrapped CAM";
  std::string symbol     = "WCAM";
  std::uint8_t decimals  = 18;
  std::string version    = "1";
  crypto::digest network_id{};
  protocol::account self = protocol::program_account( "ledger" );
};

protocol::domain make_domain( const descriptor& desc );

} // namespace custodia::token
