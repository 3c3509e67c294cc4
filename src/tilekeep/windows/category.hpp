#pragma once

#include "tilekeep/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tilekeep {

/// Classify a process by its image name (case-insensitive exact match).
AppCategory categorize(std::string_view process_name);

/// "Terminal", "Browser", ... as stored in the activity database.
char const* category_display_name(AppCategory category);

/// Single-letter tag used in compact listings ("T", "B", ..., "?").
char const* category_short_label(AppCategory category);

std::optional<AppCategory> parse_category(std::string_view display_name);

/// True if the process is one of the known terminal emulators.
bool is_terminal_process(std::string_view process_name);

std::string to_lower(std::string_view s);

} // namespace tilekeep
