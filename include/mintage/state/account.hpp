#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <mintage/protocol/address.hpp>
#include <mintage/state/error.hpp>

namespace mintage::state {

enum class account_state : std::uint8_t
{
  uninitialized,
  initialized
};

/**
 * One owner's balance of one mint.
 *
 * Layout, 117 bytes, little endian:
 *   [0, 32)    mint
 *   [32, 64)   owner
 *   [64, 72)   amount
 *   [72, 108)  delegate (optional address)
 *   [108, 116) delegated_amount
 *   [116]      state, 0 or 1
 */
struct account
{
  static constexpr std::size_t length = 117;

  protocol::address mint{};
  protocol::address owner{};
  std::uint64_t amount = 0;
  protocol::optional_address delegate;
  std::uint64_t delegated_amount = 0;
  account_state state = account_state::uninitialized;

  bool initialized() const noexcept
  {
    return state != account_state::uninitialized;
  }

  static result< account > unpack_unchecked( std::span< const std::byte > src ) noexcept;
  void pack_into( std::span< std::byte, length > dst ) const noexcept;

  bool operator==( const account& ) const = default;
};

} // namespace mintage::state
