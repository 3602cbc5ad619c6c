#include <gtest/gtest.h>

#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include <mintage/host.hpp>
#include <mintage/log.hpp>
#include <mintage/program.hpp>
#include <mintage/state.hpp>

namespace {

mintage::protocol::address make_address( std::uint8_t seed )
{
  mintage::protocol::address a;
  a.fill( static_cast< std::byte >( seed ) );
  return a;
}

} // namespace

class scenario: public ::testing::Test
{
public:
  scenario()
  {
    mintage::log::initialize();
  }

  // Replaces every {name} in text with the matching address
  std::string expand( std::string text ) const
  {
    for( const auto& [ name, address ]: { std::pair{ "{mint}", mint },
                                          std::pair{ "{alice_account}", alice_account },
                                          std::pair{ "{bob_account}", bob_account },
                                          std::pair{ "{alice}", alice },
                                          std::pair{ "{bob}", bob },
                                          std::pair{ "{authority}", authority },
                                          std::pair{ "{rent}", mintage::state::rent::id } } )
    {
      std::string key( name );
      for( auto pos = text.find( key ); pos != std::string::npos; pos = text.find( key ) )
        text.replace( pos, key.size(), mintage::protocol::to_string( address ) );
    }

    return text;
  }

  mintage::host::result< mintage::host::scenario > parse( const std::string& text ) const
  {
    return mintage::host::parse( YAML::Load( expand( text ) ) );
  }

  mintage::protocol::address mint          = make_address( 0x01 );
  mintage::protocol::address alice_account = make_address( 0x02 );
  mintage::protocol::address bob_account   = make_address( 0x03 );
  mintage::protocol::address alice         = make_address( 0x10 );
  mintage::protocol::address bob           = make_address( 0x11 );
  mintage::protocol::address authority     = make_address( 0x12 );
};

TEST_F( scenario, parse )
{
  auto s = parse( R"(
rent:
  lamports_per_byte_year: 10
  exemption_threshold: 1.5
  burn_percent: 20
log-level: debug
records:
  - { address: "{mint}", kind: mint }
  - { address: "{alice_account}", kind: account, lamports: 7 }
  - { address: "{alice}", kind: wallet }
instructions:
  - instruction: initialize_mint
    decimals: 6
    mint_authority: "{authority}"
    accounts: [ "{mint}", "{rent}" ]
  - instruction: transfer
    amount: 18446744073709551615
    accounts: [ "{alice_account}", "{bob_account}", "{alice}" ]
    signers: [ "{alice}" ]
)" );

  ASSERT_TRUE( s );
  EXPECT_EQ( s->rent.lamports_per_byte_year, 10 );
  EXPECT_EQ( s->rent.exemption_threshold, 1.5 );
  EXPECT_EQ( s->rent.burn_percent, 20 );
  ASSERT_TRUE( s->log_level );
  EXPECT_EQ( *s->log_level, "debug" );

  ASSERT_EQ( s->records.size(), 3 );
  EXPECT_EQ( s->records[ 0 ].address, mint );
  EXPECT_EQ( s->records[ 0 ].kind, mintage::host::record_kind::mint );
  EXPECT_FALSE( s->records[ 0 ].lamports );
  EXPECT_EQ( s->records[ 1 ].kind, mintage::host::record_kind::account );
  ASSERT_TRUE( s->records[ 1 ].lamports );
  EXPECT_EQ( *s->records[ 1 ].lamports, 7 );
  EXPECT_EQ( s->records[ 2 ].kind, mintage::host::record_kind::wallet );

  ASSERT_EQ( s->steps.size(), 2 );
  EXPECT_EQ( s->steps[ 0 ].instruction,
             mintage::protocol::instruction(
               mintage::protocol::initialize_mint{ .decimals = 6, .mint_authority = authority } ) );
  ASSERT_EQ( s->steps[ 0 ].records.size(), 2 );
  EXPECT_EQ( s->steps[ 0 ].records[ 1 ].address, mintage::state::rent::id );
  EXPECT_FALSE( s->steps[ 0 ].records[ 0 ].signer );

  EXPECT_EQ( s->steps[ 1 ].instruction,
             mintage::protocol::instruction( mintage::protocol::transfer{ .amount = 18'446'744'073'709'551'615ull } ) );
  ASSERT_EQ( s->steps[ 1 ].records.size(), 3 );
  EXPECT_FALSE( s->steps[ 1 ].records[ 0 ].signer );
  EXPECT_FALSE( s->steps[ 1 ].records[ 1 ].signer );
  EXPECT_TRUE( s->steps[ 1 ].records[ 2 ].signer );
}

TEST_F( scenario, defaults )
{
  auto s = parse( "records: []\n" );
  ASSERT_TRUE( s );
  EXPECT_EQ( s->rent, mintage::state::rent{} );
  EXPECT_FALSE( s->log_level );
  EXPECT_TRUE( s->records.empty() );
  EXPECT_TRUE( s->steps.empty() );
}

TEST_F( scenario, malformed )
{
  for( const auto* text: {
         "records: [ { address: \"{mint}\", kind: vault } ]",
         "records: [ { address: \"not an address\", kind: mint } ]",
         "records: [ { kind: mint } ]",
         "rent: { burn_percent: 101 }",
         "rent: { exemption_threshold: -1.0 }",
         "rent: { exemption_threshold: .nan }",
         "rent: { exemption_threshold: .inf }",
         "instructions: [ { instruction: freeze, accounts: [] } ]",
         "instructions: [ { instruction: transfer, accounts: [] } ]",
         "instructions: [ { instruction: initialize_mint, decimals: 256, mint_authority: \"{bob}\", accounts: [] } ]",
       } )
  {
    auto s = parse( text );
    ASSERT_FALSE( s ) << text;
    EXPECT_EQ( s.error(), mintage::host::host_errc::invalid_scenario ) << text;
  }

  auto missing = mintage::host::load( "/nonexistent/scenario.yaml" );
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error(), mintage::host::host_errc::invalid_scenario );
}

TEST_F( scenario, run )
{
  auto s = parse( R"(
records:
  - { address: "{mint}", kind: mint }
  - { address: "{alice_account}", kind: account }
  - { address: "{bob_account}", kind: account }
  - { address: "{alice}", kind: wallet }
  - { address: "{bob}", kind: wallet }
  - { address: "{authority}", kind: wallet }
instructions:
  - instruction: initialize_mint
    decimals: 2
    mint_authority: "{authority}"
    accounts: [ "{mint}", "{rent}" ]
  - instruction: initialize_account
    accounts: [ "{alice_account}", "{mint}", "{alice}", "{rent}" ]
  - instruction: initialize_account
    accounts: [ "{bob_account}", "{mint}", "{bob}", "{rent}" ]
  - instruction: mint_to
    amount: 100
    accounts: [ "{mint}", "{alice_account}", "{authority}" ]
    signers: [ "{authority}" ]
  - instruction: transfer
    amount: 40
    accounts: [ "{alice_account}", "{bob_account}", "{alice}" ]
  - instruction: transfer
    amount: 40
    accounts: [ "{alice_account}", "{bob_account}", "{alice}" ]
    signers: [ "{alice}" ]
)" );
  ASSERT_TRUE( s );

  mintage::host::bank b( s->rent );
  auto outcomes = mintage::host::run( *s, b );
  ASSERT_TRUE( outcomes );
  ASSERT_EQ( outcomes->size(), 6 );

  EXPECT_EQ( ( *outcomes )[ 0 ].instruction, "InitializeMint" );
  EXPECT_FALSE( ( *outcomes )[ 0 ].code );
  EXPECT_FALSE( ( *outcomes )[ 1 ].code );
  EXPECT_FALSE( ( *outcomes )[ 2 ].code );
  EXPECT_EQ( ( *outcomes )[ 3 ].instruction, "MintTo" );
  EXPECT_FALSE( ( *outcomes )[ 3 ].code );
  EXPECT_EQ( ( *outcomes )[ 4 ].instruction, "Transfer" );
  EXPECT_EQ( ( *outcomes )[ 4 ].code, mintage::program::program_errc::missing_required_signature );
  EXPECT_FALSE( ( *outcomes )[ 5 ].code );

  auto alice_state = mintage::state::unpack< mintage::state::account >( b.find( alice_account )->data );
  ASSERT_TRUE( alice_state );
  EXPECT_EQ( alice_state->amount, 60 );

  auto bob_state = mintage::state::unpack< mintage::state::account >( b.find( bob_account )->data );
  ASSERT_TRUE( bob_state );
  EXPECT_EQ( bob_state->amount, 40 );

  EXPECT_EQ( b.find( mint )->owner, mintage::program::id );
  EXPECT_EQ( b.find( mint )->lamports, b.rent().minimum_balance( mintage::state::mint::length ) );
  EXPECT_EQ( b.find( alice )->data.size(), 0 );

  EXPECT_EQ( mintage::host::describe( mint, *b.find( mint ) ),
             "mint " + mintage::protocol::to_string( mint ) + " authority="
               + mintage::protocol::to_string( authority ) + " supply=100 decimals=2 initialized=true" );
  EXPECT_EQ( mintage::host::describe( alice, *b.find( alice ) ),
             "record " + mintage::protocol::to_string( alice ) + " lamports=0 length=0" );
}

TEST_F( scenario, run_rejects_duplicate_records )
{
  auto s = parse( R"(
records:
  - { address: "{mint}", kind: mint }
  - { address: "{mint}", kind: account }
)" );
  ASSERT_TRUE( s );

  mintage::host::bank b( s->rent );
  auto outcomes = mintage::host::run( *s, b );
  ASSERT_FALSE( outcomes );
  EXPECT_EQ( outcomes.error(), mintage::host::host_errc::duplicate_record );
}

TEST_F( scenario, unknown_record_in_step )
{
  auto s = parse( R"(
records:
  - { address: "{mint}", kind: mint }
instructions:
  - instruction: initialize_mint
    decimals: 0
    mint_authority: "{authority}"
    accounts: [ "{mint}", "{rent}", "{bob}" ]
  - instruction: burn
    amount: 1
    accounts: [ "{alice_account}", "{mint}", "{alice}" ]
)" );
  ASSERT_TRUE( s );

  mintage::host::bank b( s->rent );
  auto outcomes = mintage::host::run( *s, b );
  ASSERT_TRUE( outcomes );
  ASSERT_EQ( outcomes->size(), 2 );
  EXPECT_EQ( ( *outcomes )[ 0 ].code, mintage::host::host_errc::unknown_record );
  EXPECT_EQ( ( *outcomes )[ 1 ].code, mintage::host::host_errc::unknown_record );
}

TEST_F( scenario, record_length )
{
  EXPECT_EQ( mintage::host::record_length( mintage::host::record_kind::mint ), 46 );
  EXPECT_EQ( mintage::host::record_length( mintage::host::record_kind::account ), 117 );
  EXPECT_EQ( mintage::host::record_length( mintage::host::record_kind::wallet ), 0 );
}
