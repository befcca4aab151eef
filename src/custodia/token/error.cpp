#include <custodia/token/error.hpp>

#include <string>
#include <utility>

namespace custodia::token {

struct _token_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _token_category::name() const noexcept
{
  return "token";
}

std::string _token_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< token_errc >( condition ) )
  {
    case token_errc::ok:
      return "ok"s;
    case token_errc::insufficient_balance:
      return "insufficient balance"s;
    case token_errc::insufficient_allowance:
      return "insufficient allowance"s;
    case token_errc::invalid_recipient:
      return "invalid recipient"s;
    case token_errc::invalid_sender:
      return "invalid sender"s;
    case token_errc::invalid_approver:
      return "invalid approver"s;
    case token_errc::invalid_spender:
      return "invalid spender"s;
    case token_errc::self_transfer_forbidden:
      return "transfer to the ledger account is forbidden"s;
    case token_errc::expired_authorization:
      return "expired authorization"s;
    case token_errc::invalid_signature:
      return "invalid signature"s;
    case token_errc::signer_mismatch:
      return "signer does not match owner"s;
    case token_errc::release_failed:
      return "release of escrowed asset failed"s;
    case token_errc::insufficient_funds:
      return "insufficient funds"s;
    case token_errc::overflow:
      return "overflow"s;
    case token_errc::unexpected_object:
      return "unexpected object"s;
  }
  std::unreachable();
}

const std::error_category& token_category() noexcept
{
  static _token_category category;
  return category;
}

std::error_code make_error_code( token_errc e )
{
  return std::error_code( static_cast< int >( e ), token_category() );
}

} // namespace custodia::token
