#pragma once

#include <concepts>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <mintage/host.hpp>
#include <mintage/memory.hpp>
#include <mintage/program.hpp>
#include <mintage/protocol.hpp>
#include <mintage/state.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  // A stable address derived from a readable name
  static mintage::protocol::address make_address( std::string_view name );

  std::error_code create_wallet( const mintage::protocol::address& address );
  std::error_code create_mint( const mintage::protocol::address& address );
  std::error_code create_account( const mintage::protocol::address& address );

  mintage::host::record_meta writable( const mintage::protocol::address& address ) const noexcept;
  mintage::host::record_meta signer( const mintage::protocol::address& address ) const noexcept;

  template< Instruction T >
  std::error_code execute( const T& ins, std::vector< mintage::host::record_meta > metas )
  {
    auto input = mintage::protocol::pack( ins );
    return _bank->invoke( _token, mintage::program::id, metas, input );
  }

  std::error_code execute_raw( std::span< const std::byte > input, std::vector< mintage::host::record_meta > metas );

  mintage::state::result< mintage::state::mint > read_mint( const mintage::protocol::address& address ) const;
  mintage::state::result< mintage::state::account > read_account( const mintage::protocol::address& address ) const;

  template< std::integral T >
  void append_input( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = mintage::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_input( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_input( input, std::to_underlying( t ) );
  }

  void append_input( std::vector< std::byte >& input, const mintage::protocol::address& a ) const noexcept
  {
    const auto bytes = mintage::memory::as_bytes( a );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename... Args >
  std::vector< std::byte > make_input( Args... args ) const noexcept
  {
    std::vector< std::byte > input;
    ( ( append_input( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  std::unique_ptr< mintage::host::bank > _bank;
  mintage::program::token _token;
};

} // namespace test
