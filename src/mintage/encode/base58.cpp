#include <mintage/encode/base58.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

namespace mintage::encode {

constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::uint32_t base58_radix = 58;
constexpr std::uint32_t byte_radix   = 256;

static constexpr std::array< std::int8_t, 128 > make_digit_map() noexcept
{
  std::array< std::int8_t, 128 > map{};
  map.fill( -1 );
  for( std::size_t i = 0; i < alphabet.size(); ++i )
    map[ static_cast< std::size_t >( alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return map;
}

constexpr auto digit_map = make_digit_map();

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  auto zeroes = static_cast< std::size_t >(
    std::ranges::distance( s.begin(), std::ranges::find_if( s, []( std::byte b ) { return b != std::byte{ 0 }; } ) ) );

  // Little-endian base58 digits of the non-zero tail
  std::vector< std::uint8_t > digits;
  digits.reserve( s.size() * 138 / 100 + 1 );

  for( auto b: s.subspan( zeroes ) )
  {
    auto carry = static_cast< std::uint32_t >( b );
    for( auto& digit: digits )
    {
      carry += static_cast< std::uint32_t >( digit ) * byte_radix;
      digit  = static_cast< std::uint8_t >( carry % base58_radix );
      carry /= base58_radix;
    }

    while( carry )
    {
      digits.push_back( static_cast< std::uint8_t >( carry % base58_radix ) );
      carry /= base58_radix;
    }
  }

  std::string str( zeroes, alphabet[ 0 ] );
  str.reserve( zeroes + digits.size() );
  for( auto it = digits.rbegin(); it != digits.rend(); ++it )
    str.push_back( alphabet[ *it ] );

  return str;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  auto ones = static_cast< std::size_t >(
    std::ranges::distance( sv.begin(), std::ranges::find_if( sv, []( char c ) { return c != alphabet[ 0 ]; } ) ) );

  // Little-endian bytes of the value following the leading ones
  std::vector< std::uint8_t > bytes;
  bytes.reserve( sv.size() * 733 / 1'000 + 1 );

  for( auto c: sv.substr( ones ) )
  {
    auto index = static_cast< unsigned char >( c );
    if( index >= digit_map.size() || digit_map[ index ] < 0 )
      return std::unexpected( encode_errc::invalid_character );

    auto carry = static_cast< std::uint32_t >( digit_map[ index ] );
    for( auto& b: bytes )
    {
      carry += static_cast< std::uint32_t >( b ) * base58_radix;
      b      = static_cast< std::uint8_t >( carry & 0xff );
      carry >>= 8;
    }

    while( carry )
    {
      bytes.push_back( static_cast< std::uint8_t >( carry & 0xff ) );
      carry >>= 8;
    }
  }

  std::vector< std::byte > result( ones, std::byte{ 0 } );
  result.reserve( ones + bytes.size() );
  for( auto it = bytes.rbegin(); it != bytes.rend(); ++it )
    result.push_back( static_cast< std::byte >( *it ) );

  return result;
}

} // namespace mintage::encode
