#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <mintage/protocol/error.hpp>

namespace mintage::protocol {

constexpr std::size_t address_length = 32;

struct address: std::array< std::byte, address_length >
{};

using optional_address = std::optional< address >;

constexpr address make_address( const std::array< std::uint8_t, address_length >& bytes ) noexcept
{
  address a{};
  for( std::size_t i = 0; i < address_length; ++i )
    a[ i ] = static_cast< std::byte >( bytes[ i ] );
  return a;
}

std::string to_string( const address& a );
result< address > address_from_string( std::string_view base58 ) noexcept;

} // namespace mintage::protocol
