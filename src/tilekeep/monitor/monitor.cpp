#include "monitor.hpp"
#include "tilekeep/core/log.hpp"
#include <algorithm>
#include <charconv>

namespace tilekeep {

namespace monitor_policy {

Strut strut_on_monitor(Strut const& strut, Rect const& monitor, int32_t screen_width, int32_t screen_height)
{
    auto overlap = [](int64_t reserved_edge, int64_t monitor_start, int64_t monitor_end) -> uint32_t
    {
        // reserved_edge is the inner boundary of the strut measured along the axis
        int64_t clipped = std::clamp(reserved_edge, monitor_start, monitor_end);
        return static_cast<uint32_t>(clipped - monitor_start);
    };

    int64_t mon_left = monitor.x;
    int64_t mon_right = static_cast<int64_t>(monitor.x) + monitor.width;
    int64_t mon_top = monitor.y;
    int64_t mon_bottom = static_cast<int64_t>(monitor.y) + monitor.height;

    Strut result;
    if (strut.left > 0)
        result.left = overlap(strut.left, mon_left, mon_right);
    if (strut.top > 0)
        result.top = overlap(strut.top, mon_top, mon_bottom);
    if (strut.right > 0)
    {
        int64_t boundary = static_cast<int64_t>(screen_width) - strut.right;
        result.right = static_cast<uint32_t>(mon_right - std::clamp(boundary, mon_left, mon_right));
    }
    if (strut.bottom > 0)
    {
        int64_t boundary = static_cast<int64_t>(screen_height) - strut.bottom;
        result.bottom = static_cast<uint32_t>(mon_bottom - std::clamp(boundary, mon_top, mon_bottom));
    }
    return result;
}

Rect working_area(Rect const& monitor, Strut const& strut)
{
    int32_t w = monitor.width;
    int32_t h = monitor.height;
    int32_t left = static_cast<int32_t>(strut.left);
    int32_t right = static_cast<int32_t>(strut.right);
    int32_t top = static_cast<int32_t>(strut.top);
    int32_t bottom = static_cast<int32_t>(strut.bottom);

    // Clamp total struts to monitor dimensions
    int32_t h_strut = std::min(w, left + right);
    int32_t v_strut = std::min(h, top + bottom);

    int32_t area_w = std::max<int32_t>(1, w - h_strut);
    int32_t area_h = std::max<int32_t>(1, h - v_strut);

    // If struts swallow the whole dimension, use no offset
    int32_t offset_x = (left + right >= w) ? 0 : left;
    int32_t offset_y = (top + bottom >= h) ? 0 : top;

    return { monitor.x + offset_x, monitor.y + offset_y, area_w, area_h };
}

std::optional<size_t> monitor_index_at_point(std::span<Rect const> monitors, int32_t x, int32_t y)
{
    for (size_t i = 0; i < monitors.size(); ++i)
    {
        if (monitors[i].contains(x, y))
            return i;
    }
    return std::nullopt;
}

} // namespace monitor_policy

std::vector<MonitorInfo> enumerate_monitors(WindowSystem& ws)
{
    auto monitors = ws.monitors();
    if (monitors.empty())
    {
        LOG_WARN("Window system reported no monitors");
    }
    for (auto const& m : monitors)
    {
        LOG_DEBUG(
            "Monitor {} '{}'{}: work area {}x{}+{}+{}",
            m.index,
            m.name,
            m.is_primary ? " (primary)" : "",
            m.work_area.width,
            m.work_area.height,
            m.work_area.x,
            m.work_area.y
        );
    }
    return monitors;
}

std::optional<MonitorInfo> resolve_monitor(std::span<MonitorInfo const> monitors, std::string_view spec)
{
    if (monitors.empty())
        return std::nullopt;

    auto primary_or_first = [&]() -> MonitorInfo const&
    {
        auto it = std::ranges::find_if(monitors, [](MonitorInfo const& m) { return m.is_primary; });
        return it != monitors.end() ? *it : monitors.front();
    };

    if (spec.empty() || spec == "primary")
        return primary_or_first();

    size_t index = 0;
    auto [ptr, ec] = std::from_chars(spec.data(), spec.data() + spec.size(), index);
    if (ec == std::errc() && ptr == spec.data() + spec.size())
    {
        if (index < monitors.size())
            return monitors[index];
        return monitors.front();
    }

    return primary_or_first();
}

} // namespace tilekeep
