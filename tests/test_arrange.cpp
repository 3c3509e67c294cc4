#include "fake_window_system.hpp"
#include "tilekeep/activity/tracker.hpp"
#include "tilekeep/arrange/arrange.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tilekeep;

namespace {

ArrangeRequest request_for(LayoutPreset preset)
{
    ArrangeRequest request;
    request.preset = preset;
    request.gap = 0;
    return request;
}

} // namespace

TEST_CASE("Arrange places five windows into four slots", "[arrange]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 1000, 800 });
    for (WindowId id = 1; id <= 5; ++id)
        ws.add(id, "kitty", "term " + std::to_string(id));

    auto result = arrange(ws, request_for(LayoutPreset::grid(2, 2)));

    REQUIRE(result.arranged == 4);
    REQUIRE(result.skipped == 1);
    REQUIRE(result.errors.empty());
    REQUIRE(ws.moves.size() == 4);
    REQUIRE(ws.moves[1] == Rect{ 0, 0, 500, 400 });
    REQUIRE(ws.moves[4] == Rect{ 500, 400, 500, 400 });
    REQUIRE_FALSE(ws.moves.contains(5));
}

TEST_CASE("Arrange skips disabled slots", "[arrange]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 1000, 800 });
    for (WindowId id = 1; id <= 4; ++id)
        ws.add(id, "kitty");

    auto request = request_for(LayoutPreset::grid(2, 2));
    request.disabled_slots = { 1, 2 };

    auto result = arrange(ws, request);

    REQUIRE(result.arranged == 2);
    REQUIRE(result.skipped == 2);
    REQUIRE(ws.moves[1] == Rect{ 0, 0, 500, 400 });
    REQUIRE(ws.moves[2] == Rect{ 500, 400, 500, 400 });
}

TEST_CASE("Arrange reports missing monitors", "[arrange]")
{
    test::FakeWindowSystem ws;
    ws.add(1, "kitty");

    auto result = arrange(ws, request_for(LayoutPreset::columns(2)));

    REQUIRE(result.arranged == 0);
    REQUIRE(result.skipped == 0);
    REQUIRE(result.errors == std::vector<std::string>{ "No monitors detected" });
    REQUIRE(ws.moves.empty());
}

TEST_CASE("Arrange collects per-window failures and continues", "[arrange]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 900, 600 });
    ws.add(1, "kitty", "first");
    ws.add(2, "kitty", "second").move_error = "BadWindow";
    ws.add(3, "kitty", "third");

    auto result = arrange(ws, request_for(LayoutPreset::columns(3)));

    REQUIRE(result.arranged == 2);
    REQUIRE(result.errors == std::vector<std::string>{ "Failed to position 'second': BadWindow" });
    REQUIRE(ws.moves.contains(1));
    REQUIRE(ws.moves.contains(3));
}

TEST_CASE("Arrange uses the requested monitor work area", "[arrange]")
{
    test::FakeWindowSystem ws;
    ws.monitor_list.push_back({ 0, true, "monitor-0", { 0, 0, 1920, 1080 } });
    ws.monitor_list.push_back({ 1, false, "monitor-1", { 1920, 30, 1280, 994 } });
    ws.add(1, "kitty");

    auto request = request_for(LayoutPreset::left_right());
    request.monitor = "1";
    arrange(ws, request);

    REQUIRE(ws.moves[1] == Rect{ 1920, 30, 640, 994 });
}

TEST_CASE("Arrange applies grid weights only to grid presets", "[arrange]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 1000, 500 });
    ws.add(1, "kitty");
    ws.add(2, "kitty");

    auto request = request_for(LayoutPreset::grid(2, 1));
    request.weights = GridWeights{ { 0.75f, 0.25f }, { 1.0f } };
    arrange(ws, request);

    REQUIRE(ws.moves[1] == Rect{ 0, 0, 750, 500 });
    REQUIRE(ws.moves[2] == Rect{ 750, 0, 250, 500 });

    ws.moves.clear();
    request.preset = LayoutPreset::columns(2);
    arrange(ws, request);

    REQUIRE(ws.moves[1] == Rect{ 0, 0, 500, 500 });
}

TEST_CASE("Arrange respects the target filter and own window", "[arrange]")
{
    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 1000, 500 });
    ws.add(1, "firefox");
    ws.add(2, "kitty");
    ws.add(3, "alacritty");

    auto request = request_for(LayoutPreset::columns(2));
    request.filter = TargetFilter::terminals();
    request.self = 3;
    auto result = arrange(ws, request);

    REQUIRE(result.arranged == 1);
    REQUIRE(ws.moves.contains(2));
    REQUIRE(ws.moves[2] == Rect{ 0, 0, 500, 500 });
}

TEST_CASE("Arrange smart sort puts the most used app first", "[arrange]")
{
    ActivityTracker tracker(TrackerOptions{});
    double t0 = now_ts() - 3600.0;
    tracker.channel().send({ "code", "", t0 });
    tracker.channel().send({ "kitty", "", t0 + 3000.0 });
    tracker.update();

    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 1000, 500 });
    ws.add(1, "firefox");
    ws.add(2, "kitty");
    ws.add(3, "code");

    auto request = request_for(LayoutPreset::columns(3));
    request.smart_sort = true;
    request.tracker = &tracker;
    arrange(ws, request);

    REQUIRE(ws.moves[3].x == 0);
    REQUIRE(ws.moves[1].x > ws.moves[2].x);
}

TEST_CASE("Arrange smart sort keeps pinned windows in place", "[arrange]")
{
    ActivityTracker tracker(TrackerOptions{});
    double t0 = now_ts() - 3600.0;
    tracker.channel().send({ "code", "", t0 });
    tracker.update();

    auto ws = test::FakeWindowSystem::with_single_monitor({ 0, 0, 900, 300 });
    ws.add(1, "code");
    ws.add(2, "firefox", "Inbox - Mail");
    ws.add(3, "kitty");

    PinRule mail;
    mail.title = "mail";
    mail.slot = 0;

    auto request = request_for(LayoutPreset::columns(3));
    request.smart_sort = true;
    request.tracker = &tracker;
    request.pin_rules = { mail };
    auto result = arrange(ws, request);

    REQUIRE(result.arranged == 3);
    REQUIRE(ws.moves[2].x == 0);
    REQUIRE(ws.moves[1].x == 300);
    REQUIRE(ws.moves[3].x == 600);
}
