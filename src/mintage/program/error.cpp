#include <mintage/program/error.hpp>

#include <string>
#include <utility>

namespace mintage::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _program_category::name() const noexcept
{
  return "program";
}

std::string _program_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< program_errc >( condition ) )
  {
    case program_errc::ok:
      return "ok"s;
    case program_errc::not_enough_accounts:
      return "not enough accounts"s;
    case program_errc::already_in_use:
      return "already in use"s;
    case program_errc::not_rent_exempt:
      return "lamport balance below rent-exempt threshold"s;
    case program_errc::invalid_mint:
      return "invalid mint"s;
    case program_errc::mint_mismatch:
      return "account not associated with this mint"s;
    case program_errc::self_transfer:
      return "cannot transfer to self"s;
    case program_errc::insufficient_funds:
      return "insufficient funds"s;
    case program_errc::overflow:
      return "operation overflowed"s;
    case program_errc::fixed_supply:
      return "fixed supply"s;
    case program_errc::owner_mismatch:
      return "owner does not match"s;
    case program_errc::missing_required_signature:
      return "missing required signature"s;
    case program_errc::invalid_argument:
      return "invalid argument"s;
  }
  std::unreachable();
}

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace mintage::program
