#pragma once

#include <cstdint>
#include <span>
#include <system_error>

#include <mintage/program/error.hpp>
#include <mintage/program/program.hpp>
#include <mintage/program/record.hpp>
#include <mintage/protocol/instruction.hpp>
#include <mintage/state/account.hpp>

namespace mintage::program {

struct token final: public program
{
  token()               = default;
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  // Decodes input and processes it, logging the reason for any rejection
  std::error_code run( std::span< record_handle* const > records, std::span< const std::byte > input ) override;

  /**
   * Applies one instruction to the supplied records.
   *
   * Records are consumed in the order the instruction documents. Every check
   * runs before the first write, so a returned error means no record was
   * modified.
   */
  std::error_code process( std::span< record_handle* const > records, const protocol::instruction& instruction );

private:
  std::error_code process( std::span< record_handle* const > records, const protocol::initialize_mint& ins );
  std::error_code process( std::span< record_handle* const > records, const protocol::initialize_account& ins );
  std::error_code process( std::span< record_handle* const > records, const protocol::transfer& ins );
  std::error_code process( std::span< record_handle* const > records, const protocol::approve& ins );
  std::error_code process( std::span< record_handle* const > records, const protocol::mint_to& ins );
  std::error_code process( std::span< record_handle* const > records, const protocol::burn& ins );

  static std::error_code validate_owner( const protocol::address& expected, const record_handle& authority ) noexcept;
  static std::error_code
  debit_authority( state::account& source, const record_handle& authority, std::uint64_t amount ) noexcept;
};

} // namespace mintage::program
