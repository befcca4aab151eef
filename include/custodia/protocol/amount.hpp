#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

namespace custodia::protocol {

using amount = boost::multiprecision::uint256_t;

constexpr std::size_t amount_length = 32;

using amount_data = std::array< std::byte, amount_length >;

/**
 * The largest representable amount. An allowance of this value is unlimited.
 */
inline const amount max_amount = std::numeric_limits< amount >::max();

/**
 * Big endian, fixed width encoding of an amount.
 */
amount_data to_bytes( const amount& value );
amount from_bytes( std::span< const std::byte > bytes );

} // namespace custodia::protocol
