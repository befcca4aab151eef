#pragma once

#include <vector>

#include <custodia/protocol.hpp>
#include <custodia/state_db/types.hpp>

namespace custodia::controller { namespace state {

struct genesis_entry
{
  state_db::object_space space;
  std::vector< std::byte > key;
  std::vector< std::byte > value;
};

using genesis_data = std::vector< genesis_entry >;

/**
 * A genesis entry holding `value` of the native asset for `account`.
 */
genesis_entry native_balance( const protocol::account& account, const protocol::amount& value );

}} // namespace custodia::controller::state
