#pragma once

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <ranges>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace mintage::memory {

template< typename T >
  requires( !std::is_pointer_v< T > && std::is_trivially_copyable_v< T > )
inline T bit_cast( std::span< const std::byte > bytes )
{
  if( bytes.size() < sizeof( T ) )
    throw std::runtime_error( "byte span is too small" );

  T t;
  std::memcpy( &t, bytes.data(), sizeof( T ) );
  return t;
}

template< std::ranges::contiguous_range T >
std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( t ) );
}

template< typename T, std::size_t N >
  requires( std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const std::array< T, N >& a )
{
  return std::as_bytes( std::span< const T, std::dynamic_extent >( a.data(), a.size() ) );
}

template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
inline std::span< const std::byte > as_bytes( const T& t )
{
  return std::as_bytes( std::span( std::addressof( t ), 1 ) );
}

// Copies the object representation of t to the front of dst.
template< typename T >
  requires( !std::ranges::range< T > && std::is_trivially_copyable_v< T > )
inline void store( std::span< std::byte > dst, const T& t )
{
  if( dst.size() < sizeof( T ) )
    throw std::runtime_error( "byte span is too small" );

  std::ranges::copy( as_bytes( t ), dst.begin() );
}

} // namespace mintage::memory
