#pragma once

#include <expected>
#include <system_error>

namespace custodia::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  malformed_signature
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace custodia::crypto

template<>
struct std::is_error_code_enum< custodia::crypto::crypto_errc >: public std::true_type
{};
