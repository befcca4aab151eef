#include <custodia/controller/state.hpp>
#include <custodia/token/state.hpp>

namespace custodia::controller::state {

genesis_entry native_balance( const protocol::account& account, const protocol::amount& value )
{
  const auto bytes = protocol::to_bytes( value );
  return genesis_entry{ .space = token::state::space::native_balance(),
                        .key   = std::vector< std::byte >( account.begin(), account.end() ),
                        .value = std::vector< std::byte >( bytes.begin(), bytes.end() ) };
}

} // namespace custodia::controller::state
