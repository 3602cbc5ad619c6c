#include <mintage/host/bank.hpp>

#include <algorithm>
#include <memory>
#include <utility>

#include <mintage/log.hpp>

namespace mintage::host {

namespace {

struct staged_record
{
  const record* original = nullptr;
  std::vector< std::byte > data;
};

class staged_handle final: public program::record_handle
{
public:
  staged_handle( const protocol::address& address, bool signer, staged_record& staged ):
      _address( address ),
      _signer( signer ),
      _staged( staged )
  {}

  ~staged_handle() final = default;

  std::span< std::byte > data() final
  {
    return _staged.data;
  }

  const protocol::address& address() const noexcept final
  {
    return _address;
  }

  bool is_signer() const noexcept final
  {
    return _signer;
  }

  std::uint64_t lamports() const noexcept final
  {
    return _staged.original->lamports;
  }

private:
  protocol::address _address;
  bool _signer;
  staged_record& _staged;
};

} // namespace

bank::bank( const state::rent& rent ):
    _rent( rent )
{
  auto sysvar = _rent.pack();
  _records.emplace( state::rent::id,
                    record{ .owner    = protocol::address{},
                            .lamports = _rent.minimum_balance( sysvar.size() ),
                            .data     = std::vector< std::byte >( sysvar.begin(), sysvar.end() ) } );
}

std::error_code bank::create( const protocol::address& address, record r )
{
  if( !_records.emplace( address, std::move( r ) ).second )
    return host_errc::duplicate_record;

  LOG_DEBUG( mintage::log::instance(), "Created record {}", address );

  return {};
}

const record* bank::find( const protocol::address& address ) const noexcept
{
  if( auto it = _records.find( address ); it != _records.end() )
    return &it->second;

  return nullptr;
}

const std::map< protocol::address, record >& bank::records() const noexcept
{
  return _records;
}

const state::rent& bank::rent() const noexcept
{
  return _rent;
}

std::error_code bank::invoke( program::program& p,
                              const protocol::address& program_id,
                              std::span< const record_meta > metas,
                              std::span< const std::byte > input )
{
  // A record named more than once is staged once, every handle sees the same bytes
  std::map< protocol::address, staged_record > staged;

  for( const auto& meta: metas )
  {
    if( staged.contains( meta.address ) )
      continue;

    auto original = find( meta.address );
    if( !original )
      return host_errc::unknown_record;

    staged.emplace( meta.address, staged_record{ .original = original, .data = original->data } );
  }

  std::vector< std::unique_ptr< staged_handle > > handles;
  std::vector< program::record_handle* > pointers;
  handles.reserve( metas.size() );
  pointers.reserve( metas.size() );

  for( const auto& meta: metas )
  {
    handles.emplace_back( std::make_unique< staged_handle >( meta.address, meta.signer, staged.at( meta.address ) ) );
    pointers.push_back( handles.back().get() );
  }

  LOG_TRACE_L1( mintage::log::instance(),
                "Invoking {} on {} records with input {}",
                program_id,
                metas.size(),
                mintage::log::hex{ input.data(), input.size() } );

  if( auto error = p.run( pointers, input ); error )
    return error;

  for( const auto& [ address, s ]: staged )
    if( s.original->owner != program_id && !std::ranges::equal( s.data, s.original->data ) )
    {
      LOG_WARNING( mintage::log::instance(), "Record {} was modified by {}", address, program_id );
      return host_errc::unauthorized_write;
    }

  for( auto& [ address, s ]: staged )
    _records.at( address ).data = std::move( s.data );

  LOG_DEBUG( mintage::log::instance(), "Committed {} records", staged.size() );

  return {};
}

} // namespace mintage::host
