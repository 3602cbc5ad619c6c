#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <mintage/protocol/address.hpp>
#include <mintage/state/error.hpp>

namespace mintage::state {

/**
 * Rent parameters published by the host in its rent sysvar record.
 *
 * Layout, 17 bytes, little endian:
 *   [0, 8)   lamports_per_byte_year
 *   [8, 16)  exemption_threshold (binary64)
 *   [16]     burn_percent
 */
struct rent
{
  static constexpr std::size_t length = 17;

  // SysvarRent111111111111111111111111111111111
  static constexpr protocol::address id = protocol::make_address(
    { 0x06, 0xa7, 0xd5, 0x17, 0x19, 0x2c, 0x5c, 0x51, 0x21, 0x8c, 0xc9, 0x4c, 0x3d, 0x4a, 0xf1, 0x7f,
      0x58, 0xda, 0xee, 0x08, 0x9b, 0xa1, 0xfd, 0x44, 0xe3, 0xdb, 0xd9, 0x8a, 0x00, 0x00, 0x00, 0x00 } );

  // Bytes charged for every record on top of its data
  static constexpr std::uint64_t storage_overhead = 128;

  static constexpr std::uint64_t default_lamports_per_byte_year = 3'480;
  static constexpr double default_exemption_threshold           = 2.0;
  static constexpr std::uint8_t default_burn_percent             = 50;

  std::uint64_t lamports_per_byte_year = default_lamports_per_byte_year;
  double exemption_threshold           = default_exemption_threshold;
  std::uint8_t burn_percent            = default_burn_percent;

  std::uint64_t minimum_balance( std::size_t data_length ) const noexcept;
  bool is_exempt( std::uint64_t lamports, std::size_t data_length ) const noexcept;

  static result< rent > unpack( std::span< const std::byte > src ) noexcept;
  std::array< std::byte, length > pack() const noexcept;

  bool operator==( const rent& ) const = default;
};

} // namespace mintage::state
