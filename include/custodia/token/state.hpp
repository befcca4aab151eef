#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <custodia/protocol.hpp>
#include <custodia/state_db/types.hpp>
#include <custodia/token/system_interface.hpp>

namespace custodia::token { namespace state {

namespace space {

state_db::object_space supply( const protocol::account& ledger );
state_db::object_space balance( const protocol::account& ledger );
state_db::object_space allowance( const protocol::account& ledger );
state_db::object_space nonce( const protocol::account& ledger );
const state_db::object_space& native_balance();

} // namespace space

namespace key {

std::span< const std::byte > supply();
std::array< std::byte, 2 * protocol::account_length > allowance( const protocol::account& owner,
                                                                 const protocol::account& spender );

} // namespace key

/**
 * Amounts are stored as fixed width big endian integers. A zero amount is
 * stored by removing the object.
 */
result< protocol::amount >
get_amount( system_interface& system, const state_db::object_space& space, std::span< const std::byte > key );
std::error_code put_amount( system_interface& system,
                            const state_db::object_space& space,
                            std::span< const std::byte > key,
                            const protocol::amount& value );

}} // namespace custodia::token::state
