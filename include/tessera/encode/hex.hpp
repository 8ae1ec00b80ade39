#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace tessera::encode {

// Lower case, "0x" prefixed
std::string to_hex( std::span< const std::byte > s );

/**
 * Decodes exactly out.size() bytes, with or without a "0x" prefix and in
 * either case. Returns false, leaving out unspecified, when the digit count
 * does not match the buffer or a digit is not hex.
 */
bool from_hex( std::string_view sv, std::span< std::byte > out ) noexcept;

} // namespace tessera::encode
