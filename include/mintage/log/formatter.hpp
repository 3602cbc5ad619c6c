#pragma once

#include <span>
#include <system_error>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <mintage/encode.hpp>
#include <mintage/protocol/address.hpp>

namespace mintage::log {

struct hex_tag
{};

// Raw byte strings such as instruction input
using hex = quill::BinaryData< hex_tag >;

} // namespace mintage::log

template<>
struct fmtquill::formatter< mintage::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintage::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mintage::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mintage::log::hex >: quill::BinaryDataDeferredFormatCodec< mintage::log::hex >
{};

template<>
struct fmtquill::formatter< mintage::protocol::address >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintage::protocol::address& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", mintage::encode::to_base58( a ) );
  }
};

template<>
struct quill::Codec< mintage::protocol::address >: quill::DeferredFormatCodec< mintage::protocol::address >
{};

// Categories are static objects, so the code can be formatted on the backend thread
template<>
struct fmtquill::formatter< std::error_code >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const std::error_code& ec, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{} ({}:{})", ec.message(), ec.category().name(), ec.value() );
  }
};

template<>
struct quill::Codec< std::error_code >: quill::DeferredFormatCodec< std::error_code >
{};
