#pragma once

#include <span>
#include <system_error>

#include <custodia/protocol/event.hpp>
#include <custodia/state_db/types.hpp>
#include <custodia/token/error.hpp>

namespace custodia::token {

/**
 * The services a token component needs from the operation it runs in. Reads
 * and writes go to the in-flight state node and events go to the in-flight
 * event session, so a failed operation leaves no trace.
 *
 * A missing object reads as an empty span.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual result< std::span< const std::byte > > get_object( const state_db::object_space& space,
                                                             std::span< const std::byte > key ) = 0;
  virtual std::error_code put_object( const state_db::object_space& space,
                                      std::span< const std::byte > key,
                                      std::span< const std::byte > value )                      = 0;
  virtual std::error_code remove_object( const state_db::object_space& space,
                                         std::span< const std::byte > key )                     = 0;

  virtual std::error_code event( protocol::event_data&& data ) = 0;
};

} // namespace custodia::token
