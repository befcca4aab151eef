#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace custodia::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

constexpr std::size_t object_space_padding_size = 3;
constexpr std::size_t address_size              = 32;

struct object_space
{
  bool system = false;
  std::array< std::uint8_t, object_space_padding_size > padding{};
  std::array< std::byte, address_size > address{};
  std::uint32_t id = 0;
};

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;
using genesis_init_function    = std::function< void( const state_node_ptr& ) >;

using object_map = std::map< std::vector< std::byte >, std::vector< std::byte > >;

} // namespace custodia::state_db
