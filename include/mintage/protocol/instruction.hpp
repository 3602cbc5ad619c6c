#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include <mintage/protocol/address.hpp>
#include <mintage/protocol/error.hpp>

namespace mintage::protocol {

/**
 * Wire tags. The tag is the first byte of every encoded instruction and
 * matches the alternative's index in the instruction variant.
 */
enum class instruction_tag : std::uint8_t
{
  initialize_mint,
  initialize_account,
  transfer,
  approve,
  mint_to,
  burn
};

constexpr std::size_t tag_length    = sizeof( std::uint8_t );
constexpr std::size_t amount_length = sizeof( std::uint64_t );

// Records: [mint, rent]
struct initialize_mint
{
  std::uint8_t decimals = 0;
  address mint_authority{};

  static constexpr std::size_t size() noexcept
  {
    return tag_length + sizeof( decimals ) + address_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 2;
  }

  bool operator==( const initialize_mint& ) const = default;
};

// Records: [account, mint, owner, rent]
struct initialize_account
{
  static constexpr std::size_t size() noexcept
  {
    return tag_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 4;
  }

  bool operator==( const initialize_account& ) const = default;
};

// Records: [source, destination, authority]
struct transfer
{
  std::uint64_t amount = 0;

  static constexpr std::size_t size() noexcept
  {
    return tag_length + amount_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 3;
  }

  bool operator==( const transfer& ) const = default;
};

// Records: [source, delegate, owner]
struct approve
{
  std::uint64_t amount = 0;

  static constexpr std::size_t size() noexcept
  {
    return tag_length + amount_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 3;
  }

  bool operator==( const approve& ) const = default;
};

// Records: [mint, destination, mint authority]
struct mint_to
{
  std::uint64_t amount = 0;

  static constexpr std::size_t size() noexcept
  {
    return tag_length + amount_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 3;
  }

  bool operator==( const mint_to& ) const = default;
};

// Records: [source, mint, authority]
struct burn
{
  std::uint64_t amount = 0;

  static constexpr std::size_t size() noexcept
  {
    return tag_length + amount_length;
  }

  static constexpr std::size_t records() noexcept
  {
    return 3;
  }

  bool operator==( const burn& ) const = default;
};

using instruction = std::variant< initialize_mint, initialize_account, transfer, approve, mint_to, burn >;

std::vector< std::byte > pack( const instruction& i );

/**
 * Decodes an instruction from its wire form.
 *
 * Bytes following the ones the selected variant consumes are ignored. An
 * unknown tag or a buffer too short for its tag yields invalid_instruction_data.
 */
result< instruction > unpack( std::span< const std::byte > input ) noexcept;

std::string_view name( const instruction& i ) noexcept;
std::size_t records( const instruction& i ) noexcept;

} // namespace mintage::protocol

template< typename T >
concept Instruction = std::same_as< mintage::protocol::initialize_mint, T >
                      || std::same_as< mintage::protocol::initialize_account, T >
                      || std::same_as< mintage::protocol::transfer, T > || std::same_as< mintage::protocol::approve, T >
                      || std::same_as< mintage::protocol::mint_to, T > || std::same_as< mintage::protocol::burn, T >;
