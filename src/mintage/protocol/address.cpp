#include <mintage/protocol/address.hpp>

#include <algorithm>

#include <mintage/encode/base58.hpp>

namespace mintage::protocol {

std::string to_string( const address& a )
{
  return encode::to_base58( a );
}

result< address > address_from_string( std::string_view base58 ) noexcept
{
  auto bytes = encode::from_base58( base58 );
  if( !bytes || bytes->size() != address_length )
    return std::unexpected( protocol_errc::invalid_address );

  address a;
  std::ranges::copy( *bytes, a.begin() );
  return a;
}

} // namespace mintage::protocol
