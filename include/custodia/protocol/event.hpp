#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include <custodia/protocol/account.hpp>
#include <custodia/protocol/amount.hpp>

namespace custodia::protocol {

/**
 * Units moved between accounts. A null `from` is a mint, a null `to` is a burn.
 */
struct transfer_event
{
  account from{};
  account to{};
  amount value;

  bool operator==( const transfer_event& ) const = default;
};

struct approval_event
{
  account owner{};
  account spender{};
  amount value;

  bool operator==( const approval_event& ) const = default;
};

struct deposit_event
{
  account to{};
  amount value;

  bool operator==( const deposit_event& ) const = default;
};

struct withdrawal_event
{
  account from{};
  amount value;

  bool operator==( const withdrawal_event& ) const = default;
};

using event_data = std::variant< transfer_event, approval_event, deposit_event, withdrawal_event >;

struct event
{
  std::uint32_t sequence = 0;
  account source{};
  event_data data;
  std::vector< account > impacted;
};

std::string_view event_name( const event_data& data ) noexcept;
std::vector< account > impacted_accounts( const event_data& data );

} // namespace custodia::protocol
