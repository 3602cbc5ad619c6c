#pragma once

#include <span>
#include <system_error>

#include <mintage/program/record.hpp>
#include <mintage/protocol/address.hpp>

namespace mintage::program {

// TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA
constexpr protocol::address id = protocol::make_address(
  { 0x06, 0xdd, 0xf6, 0xe1, 0xd7, 0x65, 0xa1, 0x93, 0xd9, 0xcb, 0xe1, 0x46, 0xce, 0xeb, 0x79, 0xac,
    0x1c, 0xb4, 0x85, 0xed, 0x5f, 0x5b, 0x37, 0x91, 0x3a, 0x8c, 0xf5, 0x85, 0x7e, 0xff, 0x00, 0xa9 } );

struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( std::span< record_handle* const > records, std::span< const std::byte > input ) = 0;
};

} // namespace mintage::program
