#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <mintage/protocol/address.hpp>
#include <mintage/state/error.hpp>

namespace mintage::state {

/**
 * A token type.
 *
 * Layout, 46 bytes, little endian:
 *   [0, 36)  mint_authority (optional address)
 *   [36, 44) supply
 *   [44]     decimals
 *   [45]     is_initialized, 0 or 1
 */
struct mint
{
  static constexpr std::size_t length = 46;

  // None fixes the supply for good
  protocol::optional_address mint_authority;
  std::uint64_t supply = 0;
  std::uint8_t decimals = 0;
  bool is_initialized = false;

  bool initialized() const noexcept
  {
    return is_initialized;
  }

  static result< mint > unpack_unchecked( std::span< const std::byte > src ) noexcept;
  void pack_into( std::span< std::byte, length > dst ) const noexcept;

  bool operator==( const mint& ) const = default;
};

} // namespace mintage::state
