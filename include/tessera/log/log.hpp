#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <tessera/log/formatter.hpp>
#include <tessera/log/frontend.hpp>

namespace tessera::log {

void initialize() noexcept;
logger* instance() noexcept;

// Level names as quill spells them, plus "trace" for the most verbose level. Throws on an unknown name.
void set_level( std::string_view level );

} // namespace tessera::log
