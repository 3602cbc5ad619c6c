#pragma once

#include <expected>
#include <system_error>

namespace mintage::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  not_enough_accounts,
  already_in_use,
  not_rent_exempt,
  invalid_mint,
  mint_mismatch,
  self_transfer,
  insufficient_funds,
  overflow,
  fixed_supply,
  owner_mismatch,
  missing_required_signature,
  invalid_argument
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintage::program

template<>
struct std::is_error_code_enum< mintage::program::program_errc >: public std::true_type
{};
