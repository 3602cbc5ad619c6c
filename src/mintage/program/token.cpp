#include <mintage/program/token.hpp>

#include <algorithm>
#include <limits>
#include <variant>

#include <mintage/log.hpp>
#include <mintage/state.hpp>

namespace mintage::program {

namespace {

class record_cursor
{
public:
  explicit record_cursor( std::span< record_handle* const > records ):
      _records( records )
  {}

  result< record_handle* > next() noexcept
  {
    if( _position >= _records.size() || _records[ _position ] == nullptr )
      return std::unexpected( program_errc::not_enough_accounts );

    return _records[ _position++ ];
  }

private:
  std::span< record_handle* const > _records;
  std::size_t _position = 0;
};

result< std::uint64_t > checked_add( std::uint64_t a, std::uint64_t b ) noexcept
{
  if( std::numeric_limits< std::uint64_t >::max() - a < b )
    return std::unexpected( program_errc::overflow );

  return a + b;
}

result< std::uint64_t > checked_sub( std::uint64_t a, std::uint64_t b ) noexcept
{
  if( a < b )
    return std::unexpected( program_errc::overflow );

  return a - b;
}

result< state::rent > load_rent( record_handle& rent_info ) noexcept
{
  if( rent_info.address() != state::rent::id )
    return std::unexpected( program_errc::invalid_argument );

  return state::rent::unpack( rent_info.data() );
}

// Only called once every check for the instruction has passed and the
// record's length has been confirmed by decoding it.
template< state::Record T >
void store_record( record_handle& info, const T& record ) noexcept
{
  std::ranges::copy( state::pack( record ), info.data().begin() );
}

} // namespace

std::error_code token::run( std::span< record_handle* const > records, std::span< const std::byte > input )
{
  auto instruction = protocol::unpack( input );
  if( !instruction )
  {
    LOG_WARNING( mintage::log::instance(), "Error: {}", instruction.error() );
    return instruction.error();
  }

  auto error = process( records, *instruction );
  if( error )
    LOG_WARNING( mintage::log::instance(), "Error: {}", error );

  return error;
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::instruction& instruction )
{
  LOG_DEBUG( mintage::log::instance(), "Instruction: {}", protocol::name( instruction ) );

  // Handlers still run on a short list; some rejections need fewer records
  if( auto expected = protocol::records( instruction ); records.size() < expected )
    LOG_WARNING( mintage::log::instance(),
                 "{} expects {} records, received {}",
                 protocol::name( instruction ),
                 expected,
                 records.size() );

  return std::visit(
    [ & ]( const auto& ins )
    {
      return process( records, ins );
    },
    instruction );
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::initialize_mint& ins )
{
  record_cursor cursor( records );

  auto mint_info = cursor.next();
  if( !mint_info )
    return mint_info.error();

  auto rent_info = cursor.next();
  if( !rent_info )
    return rent_info.error();

  auto rent = load_rent( **rent_info );
  if( !rent )
    return rent.error();

  auto mint = state::unpack< state::mint, state::tolerance::relaxed >( ( *mint_info )->data() );
  if( !mint )
    return mint.error();

  if( mint->is_initialized )
    return program_errc::already_in_use;

  if( !rent->is_exempt( ( *mint_info )->lamports(), ( *mint_info )->data().size() ) )
    return program_errc::not_rent_exempt;

  mint->mint_authority = ins.mint_authority;
  mint->decimals       = ins.decimals;
  mint->is_initialized = true;

  store_record( **mint_info, *mint );

  return {};
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::initialize_account& )
{
  record_cursor cursor( records );

  auto account_info = cursor.next();
  if( !account_info )
    return account_info.error();

  auto mint_info = cursor.next();
  if( !mint_info )
    return mint_info.error();

  auto owner_info = cursor.next();
  if( !owner_info )
    return owner_info.error();

  auto rent_info = cursor.next();
  if( !rent_info )
    return rent_info.error();

  auto rent = load_rent( **rent_info );
  if( !rent )
    return rent.error();

  auto account = state::unpack< state::account, state::tolerance::relaxed >( ( *account_info )->data() );
  if( !account )
    return account.error();

  if( account->initialized() )
    return program_errc::already_in_use;

  if( !rent->is_exempt( ( *account_info )->lamports(), ( *account_info )->data().size() ) )
    return program_errc::not_rent_exempt;

  if( !state::unpack< state::mint >( ( *mint_info )->data() ) )
    return program_errc::invalid_mint;

  account->mint             = ( *mint_info )->address();
  account->owner            = ( *owner_info )->address();
  account->delegate         = std::nullopt;
  account->delegated_amount = 0;
  account->state            = state::account_state::initialized;
  account->amount           = 0;

  store_record( **account_info, *account );

  return {};
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::transfer& ins )
{
  record_cursor cursor( records );

  auto source_info = cursor.next();
  if( !source_info )
    return source_info.error();

  auto dest_info = cursor.next();
  if( !dest_info )
    return dest_info.error();

  if( ( *source_info )->address() == ( *dest_info )->address() )
    return program_errc::self_transfer;

  auto authority_info = cursor.next();
  if( !authority_info )
    return authority_info.error();

  auto source = state::unpack< state::account >( ( *source_info )->data() );
  if( !source )
    return source.error();

  auto dest = state::unpack< state::account >( ( *dest_info )->data() );
  if( !dest )
    return dest.error();

  if( source->amount < ins.amount )
    return program_errc::insufficient_funds;

  if( source->mint != dest->mint )
    return program_errc::mint_mismatch;

  if( auto error = debit_authority( *source, **authority_info, ins.amount ); error )
    return error;

  auto source_amount = checked_sub( source->amount, ins.amount );
  if( !source_amount )
    return source_amount.error();

  auto dest_amount = checked_add( dest->amount, ins.amount );
  if( !dest_amount )
    return dest_amount.error();

  source->amount = *source_amount;
  dest->amount   = *dest_amount;

  store_record( **source_info, *source );
  store_record( **dest_info, *dest );

  return {};
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::approve& ins )
{
  record_cursor cursor( records );

  auto source_info = cursor.next();
  if( !source_info )
    return source_info.error();

  auto delegate_info = cursor.next();
  if( !delegate_info )
    return delegate_info.error();

  auto owner_info = cursor.next();
  if( !owner_info )
    return owner_info.error();

  auto source = state::unpack< state::account >( ( *source_info )->data() );
  if( !source )
    return source.error();

  if( auto error = validate_owner( source->owner, **owner_info ); error )
    return error;

  // Replaces any previous delegation outright
  source->delegate         = ( *delegate_info )->address();
  source->delegated_amount = ins.amount;

  store_record( **source_info, *source );

  return {};
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::mint_to& ins )
{
  record_cursor cursor( records );

  auto mint_info = cursor.next();
  if( !mint_info )
    return mint_info.error();

  auto dest_info = cursor.next();
  if( !dest_info )
    return dest_info.error();

  auto owner_info = cursor.next();
  if( !owner_info )
    return owner_info.error();

  auto dest = state::unpack< state::account >( ( *dest_info )->data() );
  if( !dest )
    return dest.error();

  if( ( *mint_info )->address() != dest->mint )
    return program_errc::mint_mismatch;

  auto mint = state::unpack< state::mint >( ( *mint_info )->data() );
  if( !mint )
    return mint.error();

  if( !mint->mint_authority )
    return program_errc::fixed_supply;

  if( auto error = validate_owner( *mint->mint_authority, **owner_info ); error )
    return error;

  auto dest_amount = checked_add( dest->amount, ins.amount );
  if( !dest_amount )
    return dest_amount.error();

  auto supply = checked_add( mint->supply, ins.amount );
  if( !supply )
    return supply.error();

  dest->amount = *dest_amount;
  mint->supply = *supply;

  store_record( **dest_info, *dest );
  store_record( **mint_info, *mint );

  return {};
}

std::error_code token::process( std::span< record_handle* const > records, const protocol::burn& ins )
{
  record_cursor cursor( records );

  auto source_info = cursor.next();
  if( !source_info )
    return source_info.error();

  auto mint_info = cursor.next();
  if( !mint_info )
    return mint_info.error();

  auto authority_info = cursor.next();
  if( !authority_info )
    return authority_info.error();

  auto source = state::unpack< state::account >( ( *source_info )->data() );
  if( !source )
    return source.error();

  if( source->amount < ins.amount )
    return program_errc::insufficient_funds;

  if( ( *mint_info )->address() != source->mint )
    return program_errc::mint_mismatch;

  if( auto error = debit_authority( *source, **authority_info, ins.amount ); error )
    return error;

  auto source_amount = checked_sub( source->amount, ins.amount );
  if( !source_amount )
    return source_amount.error();

  auto mint = state::unpack< state::mint >( ( *mint_info )->data() );
  if( !mint )
    return mint.error();

  auto supply = checked_sub( mint->supply, ins.amount );
  if( !supply )
    return supply.error();

  source->amount = *source_amount;
  mint->supply   = *supply;

  store_record( **source_info, *source );
  store_record( **mint_info, *mint );

  return {};
}

std::error_code token::validate_owner( const protocol::address& expected, const record_handle& authority ) noexcept
{
  if( expected != authority.address() )
    return program_errc::owner_mismatch;

  if( !authority.is_signer() )
    return program_errc::missing_required_signature;

  return {};
}

std::error_code
token::debit_authority( state::account& source, const record_handle& authority, std::uint64_t amount ) noexcept
{
  if( !source.delegate || *source.delegate != authority.address() )
    return validate_owner( source.owner, authority );

  if( auto error = validate_owner( *source.delegate, authority ); error )
    return error;

  if( source.delegated_amount < amount )
    return program_errc::insufficient_funds;

  auto remaining = checked_sub( source.delegated_amount, amount );
  if( !remaining )
    return remaining.error();

  source.delegated_amount = *remaining;
  if( !source.delegated_amount )
    source.delegate = std::nullopt;

  return {};
}

} // namespace mintage::program
