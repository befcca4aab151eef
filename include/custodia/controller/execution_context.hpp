#pragma once

#include <functional>
#include <vector>

#include <custodia/controller/chronicler.hpp>
#include <custodia/state_db.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::controller {

/**
 * Runs operations against the state database. Each operation is applied in a
 * temporary child of the node in flight, so an operation started while another
 * one is running (a re-entrant call) sees the writes of its caller and is
 * rolled back with it.
 */
class execution_context final: public token::system_interface
{
public:
  using operation = std::function< std::error_code( execution_context& ) >;

  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const state_db::state_node_ptr& root, chronicler& events );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  /**
   * Apply `op` atomically. Its writes and events are kept if it returns no
   * error and are discarded otherwise.
   */
  std::error_code apply( const operation& op );

  /**
   * The number of operations in flight.
   */
  std::size_t depth() const noexcept;

  token::result< std::span< const std::byte > > get_object( const state_db::object_space& space,
                                                            std::span< const std::byte > key ) final;
  std::error_code put_object( const state_db::object_space& space,
                              std::span< const std::byte > key,
                              std::span< const std::byte > value ) final;
  std::error_code remove_object( const state_db::object_space& space, std::span< const std::byte > key ) final;

  std::error_code event( protocol::event_data&& data ) final;

private:
  state_db::state_node& current() const noexcept;

  state_db::state_node_ptr _root;
  std::vector< state_db::temporary_state_node_ptr > _nodes;
  chronicler& _chronicler;
};

} // namespace custodia::controller
