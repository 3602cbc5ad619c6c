#include <mintage/state/mint.hpp>

#include <mintage/state/codec.hpp>
#include <mintage/state/layout.hpp>

namespace mintage::state {

constexpr std::size_t supply_offset         = optional_address_length;
constexpr std::size_t decimals_offset       = supply_offset + sizeof( std::uint64_t );
constexpr std::size_t is_initialized_offset = decimals_offset + sizeof( std::uint8_t );

static_assert( is_initialized_offset + 1 == mint::length );

result< mint > mint::unpack_unchecked( std::span< const std::byte > src ) noexcept
{
  if( src.size() != length )
    return std::unexpected( state_errc::invalid_record_data );

  mint m;

  if( auto authority = unpack_optional_address( src.first< optional_address_length >() ); authority )
    m.mint_authority = *authority;
  else
    return std::unexpected( authority.error() );

  m.supply   = layout::load_u64( src.subspan< supply_offset, sizeof( std::uint64_t ) >() );
  m.decimals = std::to_integer< std::uint8_t >( src[ decimals_offset ] );

  switch( std::to_integer< std::uint8_t >( src[ is_initialized_offset ] ) )
  {
    case 0:
      m.is_initialized = false;
      break;
    case 1:
      m.is_initialized = true;
      break;
    default:
      return std::unexpected( state_errc::invalid_record_data );
  }

  return m;
}

void mint::pack_into( std::span< std::byte, length > dst ) const noexcept
{
  pack_optional_address( mint_authority, dst.first< optional_address_length >() );
  layout::store_u64( dst.subspan< supply_offset, sizeof( std::uint64_t ) >(), supply );
  dst[ decimals_offset ]       = static_cast< std::byte >( decimals );
  dst[ is_initialized_offset ] = static_cast< std::byte >( is_initialized ? 1 : 0 );
}

} // namespace mintage::state
