#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include <custodia/crypto.hpp>
#include <custodia/encode.hpp>

namespace custodia::protocol {

constexpr std::size_t account_length = crypto::public_key_length;

using account = std::array< std::byte, account_length >;

constexpr account null_account{};

/**
 * The account controlled by a public key.
 */
account user_account( const crypto::public_key& key ) noexcept;
account user_account( const crypto::public_key_data& key ) noexcept;

/**
 * The account of a program, addressed by the hash of its name. No secret key
 * exists for a program account.
 */
account program_account( std::string_view name ) noexcept;

bool is_null( const account& a ) noexcept;

encode::result< account > account_from_hex( std::string_view sv ) noexcept;

} // namespace custodia::protocol
