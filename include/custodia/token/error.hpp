#pragma once

#include <expected>
#include <system_error>

namespace custodia::token {

enum class token_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  insufficient_balance,
  insufficient_allowance,
  invalid_recipient,
  invalid_sender,
  invalid_approver,
  invalid_spender,
  self_transfer_forbidden,
  expired_authorization,
  invalid_signature,
  signer_mismatch,
  release_failed,
  insufficient_funds,
  overflow,
  unexpected_object
};

const std::error_category& token_category() noexcept;

std::error_code make_error_code( token_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::token

template<>
struct std::is_error_code_enum< custodia::token::token_errc >: public std::true_type
{};
