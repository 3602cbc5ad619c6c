#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <mintage/log/formatter.hpp>
#include <mintage/log/frontend.hpp>

namespace mintage::log {

void initialize() noexcept;
logger* instance() noexcept;

// Applies a textual level ("trace_l1" through "critical", as quill spells them).
// Returns false and leaves the level untouched when the text is not a level.
bool set_level( std::string_view level ) noexcept;

} // namespace mintage::log
