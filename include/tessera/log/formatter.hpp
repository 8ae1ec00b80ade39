#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tessera/encode.hpp>
#include <tessera/math.hpp>

namespace tessera::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace tessera::log

template<>
struct fmtquill::formatter< tessera::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tessera::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tessera::log::hex >: quill::BinaryDataDeferredFormatCodec< tessera::log::hex >
{};

template<>
struct fmtquill::formatter< tessera::math::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tessera::math::amount& value, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", tessera::math::to_string( value ) );
  }
};

template<>
struct quill::Codec< tessera::math::amount >: quill::DeferredFormatCodec< tessera::math::amount >
{};
