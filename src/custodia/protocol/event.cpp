#include <custodia/protocol/event.hpp>

#include <utility>

namespace custodia::protocol {

std::string_view event_name( const event_data& data ) noexcept
{
  using namespace std::string_view_literals;

  switch( data.index() )
  {
    case 0:
      return "transfer"sv;
    case 1:
      return "approval"sv;
    case 2:
      return "deposit"sv;
    case 3:
      return "withdrawal"sv;
  }
  std::unreachable();
}

std::vector< account > impacted_accounts( const event_data& data )
{
  std::vector< account > impacted;

  if( std::holds_alternative< transfer_event >( data ) )
  {
    const auto& transfer = std::get< transfer_event >( data );
    if( !is_null( transfer.from ) )
      impacted.push_back( transfer.from );
    if( !is_null( transfer.to ) )
      impacted.push_back( transfer.to );
  }
  else if( std::holds_alternative< approval_event >( data ) )
  {
    const auto& approval = std::get< approval_event >( data );
    impacted.push_back( approval.owner );
    impacted.push_back( approval.spender );
  }
  else if( std::holds_alternative< deposit_event >( data ) )
    impacted.push_back( std::get< deposit_event >( data ).to );
  else if( std::holds_alternative< withdrawal_event >( data ) )
    impacted.push_back( std::get< withdrawal_event >( data ).from );

  return impacted;
}

} // namespace custodia::protocol
