#pragma once

#include <expected>
#include <system_error>

namespace mintage::host {

enum class host_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unknown_record,
  duplicate_record,
  unauthorized_write,
  invalid_scenario
};

const std::error_category& host_category() noexcept;

std::error_code make_error_code( host_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace mintage::host

template<>
struct std::is_error_code_enum< mintage::host::host_errc >: public std::true_type
{};
