#pragma once

#include <custodia/state_db/state_node.hpp>

namespace custodia::state_db {

/**
 * database owns the root state node. Writes are staged in temporary child
 * nodes and squashed into the root once they are known to be good.
 *
 * database is not thread safe.
 */
class database final
{
public:
  database() noexcept = default;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, running the genesis function against the new root.
   */
  void open( genesis_init_function init );

  /**
   * Close the database.
   */
  void close();

  /**
   * Discard all state and run the genesis function again.
   */
  void reset();

  /**
   * Get and return the current "root" node.
   */
  permanent_state_node_ptr root() const;

private:
  genesis_init_function _init;
  permanent_state_node_ptr _root;
};

} // namespace custodia::state_db
