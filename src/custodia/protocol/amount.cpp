#include <custodia/protocol/amount.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <custodia/memory.hpp>

namespace custodia::protocol {

amount_data to_bytes( const amount& value )
{
  std::vector< std::uint8_t > digits;
  digits.reserve( amount_length );
  boost::multiprecision::export_bits( value, std::back_inserter( digits ), 8 );

  amount_data data{};
  std::ranges::transform( digits,
                          data.end() - std::ssize( digits ),
                          []( std::uint8_t b )
                          {
                            return std::byte{ b };
                          } );
  return data;
}

amount from_bytes( std::span< const std::byte > bytes )
{
  if( bytes.size() > amount_length )
    throw std::runtime_error( "amount encoding is too large" );

  amount value;
  const auto* first = memory::pointer_cast< const std::uint8_t* >( bytes.data() );
  boost::multiprecision::import_bits( value, first, first + bytes.size(), 8 );
  return value;
}

} // namespace custodia::protocol
