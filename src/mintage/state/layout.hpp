#pragma once

#include <bit>
#include <cstdint>
#include <span>

#include <boost/endian.hpp>

#include <mintage/memory.hpp>

namespace mintage::state::layout {

inline std::uint64_t load_u64( std::span< const std::byte, sizeof( std::uint64_t ) > src ) noexcept
{
  auto value = memory::bit_cast< std::uint64_t >( src );
  boost::endian::little_to_native_inplace( value );
  return value;
}

inline void store_u64( std::span< std::byte, sizeof( std::uint64_t ) > dst, std::uint64_t value ) noexcept
{
  memory::store( dst, boost::endian::native_to_little( value ) );
}

inline double load_f64( std::span< const std::byte, sizeof( double ) > src ) noexcept
{
  return std::bit_cast< double >( load_u64( src ) );
}

inline void store_f64( std::span< std::byte, sizeof( double ) > dst, double value ) noexcept
{
  store_u64( dst, std::bit_cast< std::uint64_t >( value ) );
}

} // namespace mintage::state::layout
