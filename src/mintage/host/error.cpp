#include <mintage/host/error.hpp>

#include <string>
#include <utility>

namespace mintage::host {

struct _host_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _host_category::name() const noexcept
{
  return "host";
}

std::string _host_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< host_errc >( condition ) )
  {
    case host_errc::ok:
      return "ok"s;
    case host_errc::unknown_record:
      return "unknown record"s;
    case host_errc::duplicate_record:
      return "duplicate record"s;
    case host_errc::unauthorized_write:
      return "record modified by a program that does not own it"s;
    case host_errc::invalid_scenario:
      return "invalid scenario"s;
  }
  std::unreachable();
}

const std::error_category& host_category() noexcept
{
  static _host_category category;
  return category;
}

std::error_code make_error_code( host_errc e )
{
  return std::error_code( static_cast< int >( e ), host_category() );
}

} // namespace mintage::host
