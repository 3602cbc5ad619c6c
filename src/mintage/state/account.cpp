#include <mintage/state/account.hpp>

#include <algorithm>
#include <utility>

#include <mintage/state/codec.hpp>
#include <mintage/state/layout.hpp>

namespace mintage::state {

constexpr std::size_t mint_offset             = 0;
constexpr std::size_t owner_offset            = mint_offset + protocol::address_length;
constexpr std::size_t amount_offset           = owner_offset + protocol::address_length;
constexpr std::size_t delegate_offset         = amount_offset + sizeof( std::uint64_t );
constexpr std::size_t delegated_amount_offset = delegate_offset + optional_address_length;
constexpr std::size_t state_offset            = delegated_amount_offset + sizeof( std::uint64_t );

static_assert( state_offset + 1 == account::length );

result< account > account::unpack_unchecked( std::span< const std::byte > src ) noexcept
{
  if( src.size() != length )
    return std::unexpected( state_errc::invalid_record_data );

  account a;

  std::ranges::copy( src.subspan< mint_offset, protocol::address_length >(), a.mint.begin() );
  std::ranges::copy( src.subspan< owner_offset, protocol::address_length >(), a.owner.begin() );
  a.amount = layout::load_u64( src.subspan< amount_offset, sizeof( std::uint64_t ) >() );

  if( auto delegate = unpack_optional_address( src.subspan< delegate_offset, optional_address_length >() ); delegate )
    a.delegate = *delegate;
  else
    return std::unexpected( delegate.error() );

  a.delegated_amount = layout::load_u64( src.subspan< delegated_amount_offset, sizeof( std::uint64_t ) >() );

  switch( std::to_integer< std::uint8_t >( src[ state_offset ] ) )
  {
    case std::to_underlying( account_state::uninitialized ):
      a.state = account_state::uninitialized;
      break;
    case std::to_underlying( account_state::initialized ):
      a.state = account_state::initialized;
      break;
    default:
      return std::unexpected( state_errc::invalid_record_data );
  }

  return a;
}

void account::pack_into( std::span< std::byte, length > dst ) const noexcept
{
  std::ranges::copy( mint, dst.subspan< mint_offset, protocol::address_length >().begin() );
  std::ranges::copy( owner, dst.subspan< owner_offset, protocol::address_length >().begin() );
  layout::store_u64( dst.subspan< amount_offset, sizeof( std::uint64_t ) >(), amount );
  pack_optional_address( delegate, dst.subspan< delegate_offset, optional_address_length >() );
  layout::store_u64( dst.subspan< delegated_amount_offset, sizeof( std::uint64_t ) >(), delegated_amount );
  dst[ state_offset ] = static_cast< std::byte >( std::to_underlying( state ) );
}

} // namespace mintage::state
