#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <mintage/protocol/address.hpp>

namespace mintage::program {

/**
 * A record as the host presents it to a program for one invocation.
 *
 * The host owns the storage behind data() and decides whether writes made
 * through it are committed. is_signer() reports whether the host
 * authenticated the record's address as a signer of the invocation, and
 * lamports() is the balance backing the record, used for rent exemption.
 */
struct record_handle
{
  record_handle()                       = default;
  record_handle( const record_handle& ) = delete;
  record_handle( record_handle&& )      = delete;
  virtual ~record_handle()              = default;

  record_handle& operator=( const record_handle& ) = delete;
  record_handle& operator=( record_handle&& )      = delete;

  virtual std::span< std::byte > data()                     = 0;
  virtual const protocol::address& address() const noexcept = 0;
  virtual bool is_signer() const noexcept                   = 0;
  virtual std::uint64_t lamports() const noexcept           = 0;
};

} // namespace mintage::program
