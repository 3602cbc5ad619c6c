#include <mintage/encode/hex.hpp>

#include <array>
#include <cstdint>

namespace mintage::encode {

constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr std::string_view hex_prefix = "0x";

constexpr std::uint8_t nibble_bits = 4;
constexpr std::uint8_t nibble_mask = 0x0f;

static constexpr std::array< std::int8_t, 128 > make_nibble_map() noexcept
{
  std::array< std::int8_t, 128 > map{};
  map.fill( -1 );
  for( std::size_t i = 0; i < hex_digits.size(); ++i )
  {
    map[ static_cast< std::size_t >( hex_digits[ i ] ) ] = static_cast< std::int8_t >( i );
    if( hex_digits[ i ] >= 'a' )
      map[ static_cast< std::size_t >( hex_digits[ i ] - 'a' + 'A' ) ] = static_cast< std::int8_t >( i );
  }
  return map;
}

constexpr auto nibble_map = make_nibble_map();

static result< std::uint8_t > nibble( char c ) noexcept
{
  auto index = static_cast< unsigned char >( c );
  if( index >= nibble_map.size() || nibble_map[ index ] < 0 )
    return std::unexpected( encode_errc::invalid_character );

  return static_cast< std::uint8_t >( nibble_map[ index ] );
}

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str( hex_prefix );
  str.reserve( hex_prefix.size() + s.size() * 2 );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( hex_digits[ value >> nibble_bits ] );
    str.push_back( hex_digits[ value & nibble_mask ] );
  }

  return str;
}

result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept
{
  if( sv.starts_with( hex_prefix ) )
    sv.remove_prefix( hex_prefix.size() );

  if( sv.size() % 2 != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = nibble( sv[ i ] );
    if( !high )
      return std::unexpected( high.error() );

    auto low = nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( low.error() );

    bytes.push_back( static_cast< std::byte >( *high << nibble_bits | *low ) );
  }

  return bytes;
}

} // namespace mintage::encode
