#include <mintage/host/scenario.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <mintage/log.hpp>
#include <mintage/program/token.hpp>
#include <mintage/state.hpp>

namespace mintage::host {

namespace {

// Raised for well-formed YAML that does not describe a scenario
struct scenario_error final: std::runtime_error
{
  using std::runtime_error::runtime_error;
};

protocol::address parse_address( const YAML::Node& node )
{
  auto text    = node.as< std::string >();
  auto address = protocol::address_from_string( text );
  if( !address )
    throw scenario_error( "invalid address '" + text + "'" );

  return *address;
}

record_kind parse_kind( const YAML::Node& node )
{
  auto text = node.as< std::string >();

  if( text == "mint" )
    return record_kind::mint;
  if( text == "account" )
    return record_kind::account;
  if( text == "wallet" )
    return record_kind::wallet;

  throw scenario_error( "unknown record kind '" + text + "'" );
}

protocol::instruction parse_instruction( const YAML::Node& node )
{
  auto type = node[ "instruction" ].as< std::string >();

  if( type == "initialize_mint" )
  {
    auto decimals = node[ "decimals" ].as< unsigned int >();
    if( decimals > std::numeric_limits< std::uint8_t >::max() )
      throw scenario_error( "decimals out of range" );

    return protocol::initialize_mint{ .decimals       = static_cast< std::uint8_t >( decimals ),
                                      .mint_authority = parse_address( node[ "mint_authority" ] ) };
  }

  if( type == "initialize_account" )
    return protocol::initialize_account{};

  auto amount = node[ "amount" ].as< std::uint64_t >();

  if( type == "transfer" )
    return protocol::transfer{ .amount = amount };
  if( type == "approve" )
    return protocol::approve{ .amount = amount };
  if( type == "mint_to" )
    return protocol::mint_to{ .amount = amount };
  if( type == "burn" )
    return protocol::burn{ .amount = amount };

  throw scenario_error( "unknown instruction '" + type + "'" );
}

step parse_step( const YAML::Node& node )
{
  step s{ .instruction = parse_instruction( node ), .records = {} };

  std::vector< protocol::address > signers;
  if( const auto& list = node[ "signers" ]; list )
    for( const auto& signer: list )
      signers.push_back( parse_address( signer ) );

  for( const auto& entry: node[ "accounts" ] )
  {
    auto address = parse_address( entry );
    s.records.push_back( { .address = address, .signer = std::ranges::find( signers, address ) != signers.end() } );
  }

  return s;
}

} // namespace

result< scenario > parse( const YAML::Node& node ) noexcept
{
  scenario s;

  try
  {
    if( const auto& rent = node[ "rent" ]; rent )
    {
      if( rent[ "lamports_per_byte_year" ] )
        s.rent.lamports_per_byte_year = rent[ "lamports_per_byte_year" ].as< std::uint64_t >();
      if( rent[ "exemption_threshold" ] )
      {
        auto threshold = rent[ "exemption_threshold" ].as< double >();
        if( !std::isfinite( threshold ) || threshold < 0.0 )
          throw scenario_error( "exemption threshold must be a finite, non-negative number" );
        s.rent.exemption_threshold = threshold;
      }
      if( rent[ "burn_percent" ] )
      {
        auto burn_percent = rent[ "burn_percent" ].as< unsigned int >();
        if( burn_percent > 100 )
          throw scenario_error( "burn percent out of range" );
        s.rent.burn_percent = static_cast< std::uint8_t >( burn_percent );
      }
    }

    if( node[ "log-level" ] )
      s.log_level = node[ "log-level" ].as< std::string >();

    for( const auto& entry: node[ "records" ] )
    {
      record_spec spec{ .address  = parse_address( entry[ "address" ] ),
                        .kind     = parse_kind( entry[ "kind" ] ),
                        .lamports = std::nullopt };

      if( entry[ "lamports" ] )
        spec.lamports = entry[ "lamports" ].as< std::uint64_t >();

      s.records.push_back( spec );
    }

    for( const auto& entry: node[ "instructions" ] )
      s.steps.push_back( parse_step( entry ) );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( mintage::log::instance(), "Malformed scenario: {}", e.what() );
    return std::unexpected( host_errc::invalid_scenario );
  }
  catch( const scenario_error& e )
  {
    LOG_ERROR( mintage::log::instance(), "Malformed scenario: {}", e.what() );
    return std::unexpected( host_errc::invalid_scenario );
  }

  return s;
}

result< scenario > load( const std::filesystem::path& path ) noexcept
{
  YAML::Node node;

  try
  {
    node = YAML::LoadFile( path.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( mintage::log::instance(), "Unable to load scenario {}: {}", path.string(), e.what() );
    return std::unexpected( host_errc::invalid_scenario );
  }

  return parse( node );
}

std::size_t record_length( record_kind kind ) noexcept
{
  switch( kind )
  {
    case record_kind::mint:
      return state::mint::length;
    case record_kind::account:
      return state::account::length;
    case record_kind::wallet:
      return 0;
  }
  std::unreachable();
}

result< std::vector< outcome > > run( const scenario& s, bank& b )
{
  for( const auto& spec: s.records )
  {
    auto length = record_length( spec.kind );

    record r;
    r.owner    = spec.kind == record_kind::wallet ? protocol::address{} : program::id;
    r.lamports = spec.lamports.value_or( spec.kind == record_kind::wallet ? 0 : b.rent().minimum_balance( length ) );
    r.data.resize( length );

    if( auto error = b.create( spec.address, std::move( r ) ); error )
      return std::unexpected( error );
  }

  program::token token;
  std::vector< outcome > outcomes;
  outcomes.reserve( s.steps.size() );

  for( const auto& st: s.steps )
  {
    auto input = protocol::pack( st.instruction );
    auto code  = b.invoke( token, program::id, st.records, input );

    if( code )
      LOG_INFO( mintage::log::instance(), "{} rejected: {}", protocol::name( st.instruction ), code );
    else
      LOG_INFO( mintage::log::instance(), "{} applied", protocol::name( st.instruction ) );

    outcomes.push_back( { .instruction = std::string( protocol::name( st.instruction ) ), .code = code } );
  }

  return outcomes;
}

std::string describe( const protocol::address& address, const record& r )
{
  std::ostringstream ss;

  if( r.owner == program::id && r.data.size() == state::mint::length )
  {
    if( auto m = state::unpack< state::mint, state::tolerance::relaxed >( r.data ); m )
    {
      ss << "mint " << protocol::to_string( address );
      ss << " authority=" << ( m->mint_authority ? protocol::to_string( *m->mint_authority ) : "none" );
      ss << " supply=" << m->supply;
      ss << " decimals=" << static_cast< unsigned int >( m->decimals );
      ss << " initialized=" << std::boolalpha << m->is_initialized;
      return ss.str();
    }
  }
  else if( r.owner == program::id && r.data.size() == state::account::length )
  {
    if( auto a = state::unpack< state::account, state::tolerance::relaxed >( r.data ); a )
    {
      ss << "account " << protocol::to_string( address );
      ss << " mint=" << protocol::to_string( a->mint );
      ss << " owner=" << protocol::to_string( a->owner );
      ss << " amount=" << a->amount;
      ss << " delegate=" << ( a->delegate ? protocol::to_string( *a->delegate ) : "none" );
      ss << " delegated_amount=" << a->delegated_amount;
      ss << " initialized=" << std::boolalpha << a->initialized();
      return ss.str();
    }
  }

  ss << "record " << protocol::to_string( address );
  ss << " lamports=" << r.lamports;
  ss << " length=" << r.data.size();
  return ss.str();
}

} // namespace mintage::host
