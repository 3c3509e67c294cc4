#include "tilekeep/arrange/arrange.hpp"
#include "tilekeep/core/process.hpp"
#include "tilekeep/core/x11_window_system.hpp"
#include "tilekeep/windows/discovery.hpp"
#include "x11_test_harness.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace tilekeep;
using namespace tilekeep::test;

namespace {

constexpr auto kTimeout = std::chrono::seconds(2);

bool display_available()
{
    if (!X11TestEnvironment::instance().available())
    {
        WARN("Xvfb not available; set TILEKEEP_TEST_ALLOW_EXISTING_DISPLAY=1 to use an existing DISPLAY.");
        return false;
    }
    return true;
}

bool contains(std::vector<WindowId> const& ids, WindowId id) { return std::ranges::find(ids, id) != ids.end(); }

} // namespace

TEST_CASE("Integration: monitors cover the X screen", "[integration][monitor]")
{
    if (!display_available())
        return;
    X11Connection x11;
    REQUIRE(x11.ok());
    X11Connection* conn = &x11;

    X11WindowSystem ws;
    auto monitors = ws.monitors();

    REQUIRE_FALSE(monitors.empty());
    auto primary = resolve_monitor(monitors, "primary");
    REQUIRE(primary.has_value());
    REQUIRE(primary->work_area.width > 0);
    REQUIRE(primary->work_area.width <= conn->screen()->width_in_pixels);
    REQUIRE(primary->work_area.height <= conn->screen()->height_in_pixels);
}

TEST_CASE("Integration: application windows are discovered", "[integration][discovery]")
{
    if (!display_available())
        return;
    X11Connection x11;
    REQUIRE(x11.ok());
    X11Connection* conn = &x11;

    xcb_window_t app = create_app_window(*conn, "integration editor", 10, 20);
    xcb_window_t tool = create_app_window(*conn, "palette", 40, 40);
    set_window_type(*conn, tool, intern_atom(conn->get(), "_NET_WM_WINDOW_TYPE_UTILITY"));
    xcb_window_t hidden = create_window(*conn, 0, 0, 100, 100);
    xcb_flush(conn->get());
    REQUIRE(wait_for_viewable(*conn, app, kTimeout));

    X11WindowSystem ws;
    auto own_name = process::name_for_pid(static_cast<uint32_t>(getpid()));
    REQUIRE(own_name.has_value());

    SECTION("window system reports window details")
    {
        REQUIRE(contains(ws.top_level_windows(), app));
        REQUIRE(ws.is_visible(app));
        REQUIRE_FALSE(ws.is_visible(hidden));
        REQUIRE(ws.is_tool_window(tool));
        REQUIRE_FALSE(ws.is_minimized(app));
        REQUIRE(ws.title(app) == "integration editor");
        REQUIRE(ws.process_name(app) == own_name);
        REQUIRE(ws.frame_rect(app) == Rect{ 10, 20, 300, 200 });
    }

    SECTION("discovery keeps only the application window")
    {
        auto windows = discover(ws, TargetFilter::universal(), NO_WINDOW, {});
        std::vector<WindowId> ids;
        for (auto const& w : windows)
            ids.push_back(w.id);

        REQUIRE(contains(ids, app));
        REQUIRE_FALSE(contains(ids, tool));
        REQUIRE_FALSE(contains(ids, hidden));

        auto self_excluded = discover(ws, TargetFilter::universal(), app, {});
        REQUIRE(std::ranges::none_of(self_excluded, [&](ManagedWindow const& w) { return w.id == app; }));
    }

    destroy_window(*conn, app);
    destroy_window(*conn, tool);
    destroy_window(*conn, hidden);
}

TEST_CASE("Integration: legacy Latin-1 titles are read as UTF-8", "[integration][discovery]")
{
    if (!display_available())
        return;
    X11Connection x11;
    REQUIRE(x11.ok());

    xcb_window_t window = create_window(x11, 0, 0, 120, 80);
    set_legacy_title(x11, window, "caf\xE9");
    // Round trip so the property is set before another client reads it
    REQUIRE(get_geometry(x11, window).has_value());

    X11WindowSystem ws;
    REQUIRE(ws.title(window) == "caf\xC3\xA9");

    destroy_window(x11, window);
}

TEST_CASE("Integration: arrange configures windows into columns", "[integration][arrange]")
{
    if (!display_available())
        return;
    X11Connection x11;
    REQUIRE(x11.ok());
    X11Connection* conn = &x11;

    xcb_window_t first = create_app_window(*conn, "left", 0, 0);
    xcb_window_t second = create_app_window(*conn, "right", 50, 50);
    REQUIRE(wait_for_viewable(*conn, first, kTimeout));
    REQUIRE(wait_for_viewable(*conn, second, kTimeout));

    X11WindowSystem ws;
    auto monitor = resolve_monitor(ws.monitors(), "primary");
    REQUIRE(monitor.has_value());
    Rect const area = monitor->work_area;

    auto own_name = process::name_for_pid(static_cast<uint32_t>(getpid()));
    REQUIRE(own_name.has_value());

    ArrangeRequest request;
    request.preset = LayoutPreset::columns(2);
    request.filter = TargetFilter::custom({ *own_name });
    request.gap = 0;

    auto result = arrange(ws, request);
    REQUIRE(result.errors.empty());
    REQUIRE(result.arranged == 2);

    auto half = static_cast<uint16_t>(area.width / 2);
    auto height = static_cast<uint16_t>(area.height);
    REQUIRE(wait_for_geometry(
        *conn,
        first,
        { static_cast<int16_t>(area.x), static_cast<int16_t>(area.y), half, height },
        kTimeout
    ));
    REQUIRE(wait_for_geometry(
        *conn,
        second,
        { static_cast<int16_t>(area.x + half), static_cast<int16_t>(area.y), half, height },
        kTimeout
    ));

    destroy_window(*conn, first);
    destroy_window(*conn, second);
}
