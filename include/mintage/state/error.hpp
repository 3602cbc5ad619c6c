#pragma once

#include <expected>
#include <system_error>

namespace mintage::state {

enum class state_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_record_data,
  uninitialized_record
};

const std::error_category& state_category() noexcept;

std::error_code make_error_code( state_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintage::state

template<>
struct std::is_error_code_enum< mintage::state::state_errc >: public std::true_type
{};
