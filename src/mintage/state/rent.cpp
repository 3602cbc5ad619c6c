#include <mintage/state/rent.hpp>

#include <cmath>
#include <limits>

#include <mintage/state/layout.hpp>

namespace mintage::state {

constexpr std::size_t threshold_offset    = sizeof( std::uint64_t );
constexpr std::size_t burn_percent_offset = threshold_offset + sizeof( double );

static_assert( burn_percent_offset + 1 == rent::length );

std::uint64_t rent::minimum_balance( std::size_t data_length ) const noexcept
{
  constexpr auto max_balance = std::numeric_limits< std::uint64_t >::max();
  // 2^64, the first value a u64 cannot hold
  constexpr auto balance_limit = 18'446'744'073'709'551'616.0;

  if( std::isnan( exemption_threshold ) )
    return max_balance;

  if( exemption_threshold <= 0.0 )
    return 0;

  if( data_length > max_balance - storage_overhead )
    return max_balance;

  auto bytes = storage_overhead + static_cast< std::uint64_t >( data_length );
  if( lamports_per_byte_year && bytes > max_balance / lamports_per_byte_year )
    return max_balance;

  auto balance = static_cast< double >( bytes * lamports_per_byte_year ) * exemption_threshold;
  if( !( balance < balance_limit ) )
    return max_balance;

  return static_cast< std::uint64_t >( balance );
}

bool rent::is_exempt( std::uint64_t lamports, std::size_t data_length ) const noexcept
{
  return lamports >= minimum_balance( data_length );
}

result< rent > rent::unpack( std::span< const std::byte > src ) noexcept
{
  if( src.size() != length )
    return std::unexpected( state_errc::invalid_record_data );

  rent r;
  r.lamports_per_byte_year = layout::load_u64( src.first< sizeof( std::uint64_t ) >() );
  r.exemption_threshold    = layout::load_f64( src.subspan< threshold_offset, sizeof( double ) >() );
  r.burn_percent           = std::to_integer< std::uint8_t >( src[ burn_percent_offset ] );
  return r;
}

std::array< std::byte, rent::length > rent::pack() const noexcept
{
  std::array< std::byte, length > bytes{};
  std::span< std::byte, length > dst( bytes );
  layout::store_u64( dst.first< sizeof( std::uint64_t ) >(), lamports_per_byte_year );
  layout::store_f64( dst.subspan< threshold_offset, sizeof( double ) >(), exemption_threshold );
  dst[ burn_percent_offset ] = static_cast< std::byte >( burn_percent );
  return bytes;
}

} // namespace mintage::state
