#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <system_error>
#include <vector>

#include <mintage/host/error.hpp>
#include <mintage/program/program.hpp>
#include <mintage/protocol/address.hpp>
#include <mintage/state/rent.hpp>

namespace mintage::host {

struct record
{
  // The program allowed to modify data
  protocol::address owner{};
  std::uint64_t lamports = 0;
  std::vector< std::byte > data;
};

struct record_meta
{
  protocol::address address{};
  bool signer = false;
};

/**
 * An in-memory set of addressed records that programs are invoked against.
 *
 * Each invocation runs on staged copies of the records it names. The copies
 * replace the stored records only when the program succeeds, so a failed
 * invocation never changes the bank.
 */
class bank
{
public:
  explicit bank( const state::rent& rent = {} );
  bank( const bank& ) = delete;
  bank( bank&& )      = delete;
  ~bank()             = default;

  bank& operator=( const bank& ) = delete;
  bank& operator=( bank&& )      = delete;

  std::error_code create( const protocol::address& address, record r );
  const record* find( const protocol::address& address ) const noexcept;

  const std::map< protocol::address, record >& records() const noexcept;
  const state::rent& rent() const noexcept;

  std::error_code invoke( program::program& p,
                          const protocol::address& program_id,
                          std::span< const record_meta > metas,
                          std::span< const std::byte > input );

private:
  std::map< protocol::address, record > _records;
  state::rent _rent;
};

} // namespace mintage::host
