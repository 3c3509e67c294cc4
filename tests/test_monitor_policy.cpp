#include "fake_window_system.hpp"
#include "tilekeep/monitor/monitor.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace tilekeep;

namespace {

std::vector<MonitorInfo> three_monitors()
{
    return {
        { 0, false, "monitor-0", { 0, 0, 1920, 1080 } },
        { 1, true, "monitor-1", { 1920, 0, 2560, 1440 } },
        { 2, false, "monitor-2", { 4480, 0, 1280, 1024 } },
    };
}

} // namespace

TEST_CASE("Monitor resolve picks the primary for 'primary' and empty specs", "[monitor][policy]")
{
    auto monitors = three_monitors();

    auto primary = resolve_monitor(monitors, "primary");
    REQUIRE(primary.has_value());
    REQUIRE(primary->index == 1);

    auto empty = resolve_monitor(monitors, "");
    REQUIRE(empty.has_value());
    REQUIRE(empty->index == 1);
}

TEST_CASE("Monitor resolve selects by index", "[monitor][policy]")
{
    auto monitors = three_monitors();

    REQUIRE(resolve_monitor(monitors, "0")->index == 0);
    REQUIRE(resolve_monitor(monitors, "2")->index == 2);
}

TEST_CASE("Monitor resolve falls back to the first monitor for unknown indices", "[monitor][policy]")
{
    auto monitors = three_monitors();

    REQUIRE(resolve_monitor(monitors, "7")->index == 0);
}

TEST_CASE("Monitor resolve treats unknown names like primary", "[monitor][policy]")
{
    auto monitors = three_monitors();

    REQUIRE(resolve_monitor(monitors, "left")->index == 1);
    REQUIRE(resolve_monitor(monitors, "-1")->index == 1);
}

TEST_CASE("Monitor resolve without a primary uses the first monitor", "[monitor][policy]")
{
    auto monitors = three_monitors();
    for (auto& m : monitors)
        m.is_primary = false;

    REQUIRE(resolve_monitor(monitors, "primary")->index == 0);
}

TEST_CASE("Monitor resolve reports an empty monitor list", "[monitor][policy]")
{
    std::vector<MonitorInfo> none;
    REQUIRE_FALSE(resolve_monitor(none, "primary").has_value());
    REQUIRE_FALSE(resolve_monitor(none, "0").has_value());
}

TEST_CASE("Monitor working area removes reserved edges", "[monitor][policy]")
{
    Strut strut;
    strut.top = 30;
    strut.left = 50;

    Rect area = monitor_policy::working_area({ 0, 0, 1920, 1080 }, strut);

    REQUIRE(area == Rect{ 50, 30, 1870, 1050 });
}

TEST_CASE("Monitor working area never collapses below one pixel", "[monitor][policy]")
{
    Strut strut;
    strut.left = 1500;
    strut.right = 1500;

    Rect area = monitor_policy::working_area({ 0, 0, 1920, 1080 }, strut);

    REQUIRE(area.width == 1);
    REQUIRE(area.x == 0);
    REQUIRE(area.height == 1080);
}

TEST_CASE("Monitor strut only reduces the monitor it overlaps", "[monitor][policy]")
{
    // Screen 3840x1080 made of two 1920x1080 monitors; a 40px bottom panel
    Strut strut;
    strut.bottom = 40;
    strut.left = 60;

    Rect left{ 0, 0, 1920, 1080 };
    Rect right{ 1920, 0, 1920, 1080 };

    Strut on_left = monitor_policy::strut_on_monitor(strut, left, 3840, 1080);
    Strut on_right = monitor_policy::strut_on_monitor(strut, right, 3840, 1080);

    REQUIRE(on_left.left == 60);
    REQUIRE(on_left.bottom == 40);
    REQUIRE(on_right.left == 0);
    REQUIRE(on_right.bottom == 40);
}

TEST_CASE("Monitor index at point finds the containing monitor", "[monitor][policy]")
{
    std::vector<Rect> rects{ { 0, 0, 1920, 1080 }, { 1920, 0, 1280, 1024 } };

    REQUIRE(monitor_policy::monitor_index_at_point(rects, 10, 10) == 0);
    REQUIRE(monitor_policy::monitor_index_at_point(rects, 1920, 500) == 1);
    REQUIRE_FALSE(monitor_policy::monitor_index_at_point(rects, 1920, 1050).has_value());
}

TEST_CASE("Monitor enumeration passes through the window system list", "[monitor]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 24, 1280, 776 });

    auto monitors = enumerate_monitors(ws);

    REQUIRE(monitors.size() == 1);
    REQUIRE(monitors[0].is_primary);
    REQUIRE(monitors[0].work_area == Rect{ 0, 24, 1280, 776 });

    test::FakeWindowSystem empty;
    REQUIRE(enumerate_monitors(empty).empty());
}
