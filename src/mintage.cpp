#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

#include <mintage/host.hpp>
#include <mintage/log.hpp>

namespace constants {

using namespace std::string_view_literals;

constexpr auto help_option       = "help,h"sv;
constexpr auto version_option    = "version,v"sv;
constexpr auto scenario_option   = "scenario,s"sv;
constexpr auto log_level_option  = "log-level,l"sv;
constexpr auto log_level_default = "info"sv;

} // namespace constants

auto main( int argc, char** argv ) -> int
{
  mintage::log::initialize();

  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( constants::help_option.data()     , "Print this help message and exit" )
    ( constants::version_option.data()  , "Print version string and exit" )
    ( constants::scenario_option.data() , boost::program_options::value< std::string >(), "The scenario file to run" )
    ( constants::log_level_option.data(), boost::program_options::value< std::string >(), "The log filtering level" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    LOG_ERROR( mintage::log::instance(), "{}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::cout << "v0.1.0" << '\n';
    return EXIT_SUCCESS;
  }

  if( !args.count( "scenario" ) )
  {
    LOG_ERROR( mintage::log::instance(), "A scenario file is required" );
    return EXIT_FAILURE;
  }

  auto path     = std::filesystem::path( args[ "scenario" ].as< std::string >() );
  auto scenario = mintage::host::load( path );
  if( !scenario )
  {
    LOG_ERROR( mintage::log::instance(), "Unable to run {}: {}", path.string(), scenario.error().message() );
    return EXIT_FAILURE;
  }

  // The command line takes precedence over the scenario file
  std::string log_level( constants::log_level_default );
  if( args.count( "log-level" ) )
    log_level = args[ "log-level" ].as< std::string >();
  else if( scenario->log_level )
    log_level = *scenario->log_level;

  if( !mintage::log::set_level( log_level ) )
  {
    LOG_ERROR( mintage::log::instance(), "Unknown log level: {}", log_level );
    return EXIT_FAILURE;
  }

  LOG_INFO( mintage::log::instance(), "Running scenario {}", path.string() );

  mintage::host::bank bank( scenario->rent );
  auto outcomes = mintage::host::run( *scenario, bank );
  if( !outcomes )
  {
    LOG_ERROR( mintage::log::instance(), "Unable to set up {}: {}", path.string(), outcomes.error().message() );
    return EXIT_FAILURE;
  }

  std::size_t index = 0;
  for( const auto& outcome: *outcomes )
    std::cout << index++ << ' ' << outcome.instruction << ": " << ( outcome.code ? outcome.code.message() : "ok" )
              << '\n';

  for( const auto& [ address, record ]: bank.records() )
    std::cout << mintage::host::describe( address, record ) << '\n';

  return EXIT_SUCCESS;
}
