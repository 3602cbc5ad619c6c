#include <mintage/protocol/instruction.hpp>

#include <algorithm>
#include <type_traits>
#include <utility>

#include <boost/endian.hpp>

#include <mintage/memory.hpp>

namespace mintage::protocol {

static_assert( std::variant_size_v< instruction > == std::to_underlying( instruction_tag::burn ) + 1 );

template< typename T >
static constexpr bool carries_amount =
  std::is_same_v< T, transfer > || std::is_same_v< T, approve > || std::is_same_v< T, mint_to >
  || std::is_same_v< T, burn >;

template< typename T >
  requires carries_amount< T >
static T unpack_amount( std::span< const std::byte > input )
{
  auto amount = memory::bit_cast< std::uint64_t >( input.subspan( tag_length, amount_length ) );
  boost::endian::little_to_native_inplace( amount );
  return T{ .amount = amount };
}

std::vector< std::byte > pack( const instruction& i )
{
  return std::visit(
    [ tag = static_cast< std::byte >( i.index() ) ]< typename T >( const T& ins )
    {
      std::vector< std::byte > bytes( T::size() );
      bytes[ 0 ] = tag;

      if constexpr( std::is_same_v< T, initialize_mint > )
      {
        bytes[ tag_length ] = static_cast< std::byte >( ins.decimals );
        std::ranges::copy( ins.mint_authority, bytes.begin() + tag_length + sizeof( ins.decimals ) );
      }
      else if constexpr( carries_amount< T > )
      {
        memory::store( std::span( bytes ).subspan( tag_length ), boost::endian::native_to_little( ins.amount ) );
      }

      return bytes;
    },
    i );
}

result< instruction > unpack( std::span< const std::byte > input ) noexcept
{
  if( input.empty() )
    return std::unexpected( protocol_errc::invalid_instruction_data );

  switch( std::to_integer< std::uint8_t >( input[ 0 ] ) )
  {
    case std::to_underlying( instruction_tag::initialize_mint ):
      {
        if( input.size() < initialize_mint::size() )
          return std::unexpected( protocol_errc::invalid_instruction_data );

        initialize_mint ins;
        ins.decimals = std::to_integer< std::uint8_t >( input[ tag_length ] );
        std::ranges::copy( input.subspan( tag_length + sizeof( ins.decimals ), address_length ),
                           ins.mint_authority.begin() );
        return ins;
      }
    case std::to_underlying( instruction_tag::initialize_account ):
      return initialize_account{};
    case std::to_underlying( instruction_tag::transfer ):
      if( input.size() < transfer::size() )
        return std::unexpected( protocol_errc::invalid_instruction_data );
      return unpack_amount< transfer >( input );
    case std::to_underlying( instruction_tag::approve ):
      if( input.size() < approve::size() )
        return std::unexpected( protocol_errc::invalid_instruction_data );
      return unpack_amount< approve >( input );
    case std::to_underlying( instruction_tag::mint_to ):
      if( input.size() < mint_to::size() )
        return std::unexpected( protocol_errc::invalid_instruction_data );
      return unpack_amount< mint_to >( input );
    case std::to_underlying( instruction_tag::burn ):
      if( input.size() < burn::size() )
        return std::unexpected( protocol_errc::invalid_instruction_data );
      return unpack_amount< burn >( input );
    default:
      break;
  }

  return std::unexpected( protocol_errc::invalid_instruction_data );
}

std::string_view name( const instruction& i ) noexcept
{
  using namespace std::string_view_literals;
  switch( static_cast< instruction_tag >( i.index() ) )
  {
    case instruction_tag::initialize_mint:
      return "InitializeMint"sv;
    case instruction_tag::initialize_account:
      return "InitializeAccount"sv;
    case instruction_tag::transfer:
      return "Transfer"sv;
    case instruction_tag::approve:
      return "Approve"sv;
    case instruction_tag::mint_to:
      return "MintTo"sv;
    case instruction_tag::burn:
      return "Burn"sv;
  }
  std::unreachable();
}

std::size_t records( const instruction& i ) noexcept
{
  return std::visit(
    []< typename T >( const T& ) noexcept
    {
      return T::records();
    },
    i );
}

} // namespace mintage::protocol
