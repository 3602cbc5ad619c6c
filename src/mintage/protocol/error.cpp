#include <mintage/protocol/error.hpp>

#include <string>
#include <utility>

namespace mintage::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _protocol_category::name() const noexcept
{
  return "protocol";
}

std::string _protocol_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< protocol_errc >( condition ) )
  {
    case protocol_errc::ok:
      return "ok"s;
    case protocol_errc::invalid_instruction_data:
      return "invalid instruction data"s;
    case protocol_errc::invalid_address:
      return "invalid address"s;
  }
  std::unreachable();
}

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace mintage::protocol
