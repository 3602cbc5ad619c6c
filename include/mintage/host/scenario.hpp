#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <mintage/host/bank.hpp>
#include <mintage/host/error.hpp>
#include <mintage/protocol/address.hpp>
#include <mintage/protocol/instruction.hpp>
#include <mintage/state/rent.hpp>

namespace mintage::host {

enum class record_kind : std::uint8_t
{
  mint,
  account,
  wallet
};

struct record_spec
{
  protocol::address address{};
  record_kind kind = record_kind::wallet;
  std::optional< std::uint64_t > lamports;
};

struct step
{
  protocol::instruction instruction;
  std::vector< record_meta > records;
};

/**
 * A scripted run: the rent parameters, the records to create and the
 * instructions to execute against them, in order.
 */
struct scenario
{
  state::rent rent;
  std::optional< std::string > log_level;
  std::vector< record_spec > records;
  std::vector< step > steps;
};

struct outcome
{
  std::string instruction;
  std::error_code code;
};

result< scenario > parse( const YAML::Node& node ) noexcept;
result< scenario > load( const std::filesystem::path& path ) noexcept;

std::size_t record_length( record_kind kind ) noexcept;

// Creates the scenario's records in b, then runs each step
result< std::vector< outcome > > run( const scenario& s, bank& b );

// One line describing a record, decoded when the token program owns it
std::string describe( const protocol::address& address, const record& r );

} // namespace mintage::host
