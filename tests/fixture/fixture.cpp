// NOLINTBEGIN

#include <test/fixture.hpp>

#include <algorithm>

#include <mintage/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  mintage::log::initialize();
  if( !mintage::log::set_level( log_level ) )
    LOG_WARNING( mintage::log::instance(), "Unknown log level: {}", log_level );

  LOG_INFO( mintage::log::instance(), "Starting fixture: {}", name );

  _bank = std::make_unique< mintage::host::bank >();
}

fixture::~fixture()
{
  mintage::log::instance()->flush_log();
}

mintage::protocol::address fixture::make_address( std::string_view name )
{
  mintage::protocol::address a{};
  std::ranges::transform( name.substr( 0, a.size() ),
                          a.begin(),
                          []( char c )
                          {
                            return static_cast< std::byte >( c );
                          } );
  return a;
}

std::error_code fixture::create_wallet( const mintage::protocol::address& address )
{
  return _bank->create( address, mintage::host::record{} );
}

std::error_code fixture::create_mint( const mintage::protocol::address& address )
{
  mintage::host::record r;
  r.owner    = mintage::program::id;
  r.lamports = _bank->rent().minimum_balance( mintage::state::mint::length );
  r.data.resize( mintage::state::mint::length );
  return _bank->create( address, std::move( r ) );
}

std::error_code fixture::create_account( const mintage::protocol::address& address )
{
  mintage::host::record r;
  r.owner    = mintage::program::id;
  r.lamports = _bank->rent().minimum_balance( mintage::state::account::length );
  r.data.resize( mintage::state::account::length );
  return _bank->create( address, std::move( r ) );
}

mintage::host::record_meta fixture::writable( const mintage::protocol::address& address ) const noexcept
{
  return mintage::host::record_meta{ .address = address, .signer = false };
}

mintage::host::record_meta fixture::signer( const mintage::protocol::address& address ) const noexcept
{
  return mintage::host::record_meta{ .address = address, .signer = true };
}

std::error_code fixture::execute_raw( std::span< const std::byte > input,
                                      std::vector< mintage::host::record_meta > metas )
{
  return _bank->invoke( _token, mintage::program::id, metas, input );
}

mintage::state::result< mintage::state::mint > fixture::read_mint( const mintage::protocol::address& address ) const
{
  const auto* r = _bank->find( address );
  if( !r )
    return std::unexpected( mintage::host::host_errc::unknown_record );

  return mintage::state::unpack< mintage::state::mint >( r->data );
}

mintage::state::result< mintage::state::account >
fixture::read_account( const mintage::protocol::address& address ) const
{
  const auto* r = _bank->find( address );
  if( !r )
    return std::unexpected( mintage::host::host_errc::unknown_record );

  return mintage::state::unpack< mintage::state::account >( r->data );
}

} // namespace test

// NOLINTEND
