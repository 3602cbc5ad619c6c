#include <mintage/state/error.hpp>

#include <string>
#include <utility>

namespace mintage::state {

struct _state_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _state_category::name() const noexcept
{
  return "state";
}

std::string _state_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< state_errc >( condition ) )
  {
    case state_errc::ok:
      return "ok"s;
    case state_errc::invalid_record_data:
      return "invalid record data"s;
    case state_errc::uninitialized_record:
      return "record is not initialized"s;
  }
  std::unreachable();
}

const std::error_category& state_category() noexcept
{
  static _state_category category;
  return category;
}

std::error_code make_error_code( state_errc e )
{
  return std::error_code( static_cast< int >( e ), state_category() );
}

} // namespace mintage::state
