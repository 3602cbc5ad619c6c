#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

#include <mintage/protocol/address.hpp>
#include <mintage/state/error.hpp>

namespace mintage::state {

enum class tolerance : std::uint8_t
{
  relaxed,
  strict
};

// 4 byte tag followed by the address, zeroed when absent
constexpr std::size_t optional_address_length = 4 + protocol::address_length;

result< protocol::optional_address >
unpack_optional_address( std::span< const std::byte, optional_address_length > src ) noexcept;

void pack_optional_address( const protocol::optional_address& a,
                            std::span< std::byte, optional_address_length > dst ) noexcept;

template< typename T >
concept Record = requires( const T& t, std::span< const std::byte > src, std::span< std::byte, T::length > dst ) {
  { T::length } -> std::convertible_to< std::size_t >;
  { T::unpack_unchecked( src ) } -> std::same_as< result< T > >;
  { t.pack_into( dst ) } noexcept;
};

/**
 * Decodes a record of type T.
 *
 * A relaxed decode accepts records that have never been initialized, which
 * is how a freshly allocated, zero filled buffer reads. A strict decode
 * rejects those with uninitialized_record. Both reject buffers of the wrong
 * length and malformed tag bytes with invalid_record_data.
 */
template< Record T, tolerance Tol = tolerance::strict >
result< T > unpack( std::span< const std::byte > src ) noexcept
{
  auto record = T::unpack_unchecked( src );

  if constexpr( Tol == tolerance::strict )
    if( record && !record->initialized() )
      return std::unexpected( state_errc::uninitialized_record );

  return record;
}

template< Record T >
std::array< std::byte, T::length > pack( const T& t ) noexcept
{
  std::array< std::byte, T::length > bytes{};
  t.pack_into( bytes );
  return bytes;
}

template< Record T >
std::error_code pack( const T& t, std::span< std::byte > dst ) noexcept
{
  if( dst.size() != T::length )
    return state_errc::invalid_record_data;

  t.pack_into( dst.template first< T::length >() );
  return {};
}

} // namespace mintage::state
