#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <custodia/encode/error.hpp>

namespace custodia::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decodes a fixed width value such as an account or a key. The input must
 * hold exactly `N` bytes.
 */
template< std::size_t N >
result< std::array< std::byte, N > > from_hex( std::string_view sv ) noexcept
{
  auto bytes = from_hex( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != N )
    return std::unexpected( encode_errc::unexpected_size );

  std::array< std::byte, N > value{};
  std::ranges::copy( *bytes, value.begin() );
  return value;
}

} // namespace custodia::encode
