#include <gtest/gtest.h>

#include <custodia/encode/hex.hpp>
#include <custodia/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "0x04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = custodia::encode::to_hex( custodia::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( custodia::encode::to_hex( {} ), "0x" );
}

TEST( hex, decode )
{
  auto decoded_data = custodia::encode::from_hex( valid_hex_str );

  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, custodia::memory::as_bytes( data ) ) );

  decoded_data = custodia::encode::from_hex( valid_hex_str.substr( 2 ) );
  EXPECT_TRUE( decoded_data );
  EXPECT_TRUE( std::ranges::equal( *decoded_data, custodia::memory::as_bytes( data ) ) );

  decoded_data = custodia::encode::from_hex( "0x0408"sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_EQ( decoded_data->size(), 2 );

  decoded_data = custodia::encode::from_hex( ""sv );
  ASSERT_TRUE( decoded_data );
  EXPECT_TRUE( decoded_data->empty() );

  decoded_data = custodia::encode::from_hex( valid_hex_str.substr( 3 ) );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error().value(), static_cast< int >( custodia::encode::encode_errc::invalid_length ) );
    EXPECT_EQ( decoded_data.error().message(),
               custodia::encode::encode_category().message(
                 static_cast< int >( custodia::encode::encode_errc::invalid_length ) ) );
  }

  decoded_data = custodia::encode::from_hex( "0x0g"sv );
  if( decoded_data )
    ADD_FAILURE() << "hex decode erroneously succeeded";
  else
  {
    EXPECT_EQ( decoded_data.error().value(), static_cast< int >( custodia::encode::encode_errc::invalid_character ) );
    EXPECT_EQ( decoded_data.error().message(),
               custodia::encode::encode_category().message(
                 static_cast< int >( custodia::encode::encode_errc::invalid_character ) ) );
  }
}

TEST( hex, decode_fixed_width )
{
  auto decoded = custodia::encode::from_hex< 6 >( valid_hex_str );
  ASSERT_TRUE( decoded );
  EXPECT_TRUE( std::ranges::equal( *decoded, custodia::memory::as_bytes( data ) ) );

  auto short_value = custodia::encode::from_hex< 7 >( valid_hex_str );
  ASSERT_FALSE( short_value );
  EXPECT_EQ( short_value.error(), custodia::encode::encode_errc::unexpected_size );

  auto odd_value = custodia::encode::from_hex< 6 >( valid_hex_str.substr( 3 ) );
  ASSERT_FALSE( odd_value );
  EXPECT_EQ( odd_value.error(), custodia::encode::encode_errc::invalid_length );
}
