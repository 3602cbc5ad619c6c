#include <mintage/state/codec.hpp>

#include <algorithm>

namespace mintage::state {

constexpr std::array< std::byte, 4 > tag_none{ std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 } };
constexpr std::array< std::byte, 4 > tag_some{ std::byte{ 1 }, std::byte{ 0 }, std::byte{ 0 }, std::byte{ 0 } };

result< protocol::optional_address >
unpack_optional_address( std::span< const std::byte, optional_address_length > src ) noexcept
{
  auto tag  = src.first< tag_none.size() >();
  auto body = src.last< protocol::address_length >();

  if( std::ranges::equal( tag, tag_none ) )
    return protocol::optional_address{};

  if( std::ranges::equal( tag, tag_some ) )
  {
    protocol::address a;
    std::ranges::copy( body, a.begin() );
    return a;
  }

  return std::unexpected( state_errc::invalid_record_data );
}

void pack_optional_address( const protocol::optional_address& a,
                            std::span< std::byte, optional_address_length > dst ) noexcept
{
  auto tag  = dst.first< tag_none.size() >();
  auto body = dst.last< protocol::address_length >();

  if( a )
  {
    std::ranges::copy( tag_some, tag.begin() );
    std::ranges::copy( *a, body.begin() );
  }
  else
  {
    std::ranges::copy( tag_none, tag.begin() );
    std::ranges::fill( body, std::byte{ 0 } );
  }
}

} // namespace mintage::state
