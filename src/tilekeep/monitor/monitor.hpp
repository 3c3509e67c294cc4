#pragma once

#include "tilekeep/core/types.hpp"
#include "tilekeep/core/window_system.hpp"
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tilekeep {

namespace monitor_policy {

/**
 * @brief Portion of a screen-edge strut that falls on one monitor.
 *
 * EWMH struts are measured from the edges of the whole X screen. On a
 * multi-head layout only the part that overlaps the monitor reduces its
 * usable area.
 */
Strut strut_on_monitor(Strut const& strut, Rect const& monitor, int32_t screen_width, int32_t screen_height);

/// Monitor rectangle minus reserved edges, never smaller than 1x1.
Rect working_area(Rect const& monitor, Strut const& strut);

/// Index of the monitor containing a point, if any.
std::optional<size_t> monitor_index_at_point(std::span<Rect const> monitors, int32_t x, int32_t y);

} // namespace monitor_policy

/// All displays known to the window system. Empty means "no monitors detected".
std::vector<MonitorInfo> enumerate_monitors(WindowSystem& ws);

/**
 * @brief Resolve a monitor selector against the detected displays.
 *
 * "primary" or "" selects the primary display, a number selects by index,
 * and anything else is treated like "primary". Unknown indices and a missing
 * primary fall back to the first display.
 *
 * @return nullopt only when monitors is empty
 */
std::optional<MonitorInfo> resolve_monitor(std::span<MonitorInfo const> monitors, std::string_view spec);

} // namespace tilekeep
