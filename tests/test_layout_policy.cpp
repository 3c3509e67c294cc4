#include "tilekeep/layout/layout.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace tilekeep;

TEST_CASE("Layout parse accepts grid strings", "[layout][policy]")
{
    REQUIRE(LayoutPreset::parse("2x3") == LayoutPreset::grid(2, 3));
    REQUIRE(LayoutPreset::parse("  4X2 ") == LayoutPreset::grid(4, 2));
    REQUIRE(LayoutPreset::parse("1x1") == LayoutPreset::grid(1, 1));
}

TEST_CASE("Layout parse rejects zero and non-numeric grids", "[layout][policy]")
{
    REQUIRE_FALSE(LayoutPreset::parse("0x3").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("2x0").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("axb").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("2x").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("diagonal").has_value());
}

TEST_CASE("Layout parse rejects counts above the limit", "[layout][policy]")
{
    REQUIRE(LayoutPreset::parse("256x1") == LayoutPreset::grid(LayoutPreset::MAX_COUNT, 1));
    REQUIRE_FALSE(LayoutPreset::parse("100000x100000").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("2x257").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("columns:300").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("rows:99999999999").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("main-side:100000").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("focus:257").has_value());
}

TEST_CASE("Layout presets above the limit produce no slots", "[layout][policy]")
{
    Rect area{ 0, 0, 1920, 1080 };
    REQUIRE(LayoutPreset::grid(100000, 1).compute_slots(area, 0).empty());
    REQUIRE(LayoutPreset::columns(LayoutPreset::MAX_COUNT + 1).compute_slots(area, 0).empty());
    REQUIRE(LayoutPreset::main_side(4000000000u).compute_slots(area, 0).empty());
    REQUIRE(LayoutPreset::rows_of(LayoutPreset::MAX_COUNT).compute_slots(area, 0).size() == 256);
}

TEST_CASE("Layout parse accepts columns and rows with a count", "[layout][policy]")
{
    REQUIRE(LayoutPreset::parse("columns:4") == LayoutPreset::columns(4));
    REQUIRE(LayoutPreset::parse("columns 3") == LayoutPreset::columns(3));
    REQUIRE(LayoutPreset::parse("ROWS:2") == LayoutPreset::rows_of(2));

    REQUIRE_FALSE(LayoutPreset::parse("columns:0").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("rows:abc").has_value());
    REQUIRE_FALSE(LayoutPreset::parse("columns").has_value());
}

TEST_CASE("Layout parse accepts split aliases", "[layout][policy]")
{
    REQUIRE(LayoutPreset::parse("left-right") == LayoutPreset::left_right());
    REQUIRE(LayoutPreset::parse("leftright") == LayoutPreset::left_right());
    REQUIRE(LayoutPreset::parse("split") == LayoutPreset::left_right());
    REQUIRE(LayoutPreset::parse("top-bottom") == LayoutPreset::top_bottom());
    REQUIRE(LayoutPreset::parse("TopBottom") == LayoutPreset::top_bottom());
}

TEST_CASE("Layout parse applies main-side and focus defaults", "[layout][policy]")
{
    REQUIRE(LayoutPreset::parse("main-side") == LayoutPreset::main_side(2));
    REQUIRE(LayoutPreset::parse("mainside:4") == LayoutPreset::main_side(4));
    REQUIRE(LayoutPreset::parse("main-side:0") == LayoutPreset::main_side(1));
    REQUIRE(LayoutPreset::parse("focus") == LayoutPreset::focus(3));
    REQUIRE(LayoutPreset::parse("focus:2") == LayoutPreset::focus(2));
    REQUIRE(LayoutPreset::parse("focus:junk") == LayoutPreset::focus(3));
}

TEST_CASE("Layout slot count matches preset shape", "[layout][policy]")
{
    REQUIRE(LayoutPreset::grid(2, 3).slot_count() == 6);
    REQUIRE(LayoutPreset::columns(4).slot_count() == 4);
    REQUIRE(LayoutPreset::rows_of(3).slot_count() == 3);
    REQUIRE(LayoutPreset::left_right().slot_count() == 2);
    REQUIRE(LayoutPreset::top_bottom().slot_count() == 2);
    REQUIRE(LayoutPreset::main_side(2).slot_count() == 3);
    REQUIRE(LayoutPreset::focus(3).slot_count() == 4);
}

TEST_CASE("Layout 2x2 grid with gap splits a square area", "[layout][policy]")
{
    Rect area{ 0, 0, 1000, 1000 };
    auto slots = LayoutPreset::grid(2, 2).compute_slots(area, 10);

    REQUIRE(slots.size() == 4);
    REQUIRE(slots[0] == Rect{ 0, 0, 495, 495 });
    REQUIRE(slots[1] == Rect{ 505, 0, 495, 495 });
    REQUIRE(slots[2] == Rect{ 0, 505, 495, 495 });
    REQUIRE(slots[3] == Rect{ 505, 505, 495, 495 });
}

TEST_CASE("Layout grid slots stay inside the area and never overlap", "[layout][policy]")
{
    Rect area{ 100, 50, 1917, 1043 };
    int32_t gap = 7;

    for (uint32_t cols = 1; cols <= 4; ++cols)
    {
        for (uint32_t rows = 1; rows <= 4; ++rows)
        {
            auto slots = LayoutPreset::grid(cols, rows).compute_slots(area, gap);
            REQUIRE(slots.size() == cols * rows);

            int32_t cell_w = slots[0].width;
            int32_t cell_h = slots[0].height;
            REQUIRE(cell_w * static_cast<int32_t>(cols) + gap * static_cast<int32_t>(cols - 1) <= area.width);
            REQUIRE(cell_h * static_cast<int32_t>(rows) + gap * static_cast<int32_t>(rows - 1) <= area.height);

            for (size_t i = 0; i < slots.size(); ++i)
            {
                REQUIRE(slots[i].x >= area.x);
                REQUIRE(slots[i].y >= area.y);
                REQUIRE(slots[i].x + slots[i].width <= area.x + area.width);
                REQUIRE(slots[i].y + slots[i].height <= area.y + area.height);

                for (size_t j = i + 1; j < slots.size(); ++j)
                {
                    bool apart = slots[i].x + slots[i].width <= slots[j].x || slots[j].x + slots[j].width <= slots[i].x
                        || slots[i].y + slots[i].height <= slots[j].y || slots[j].y + slots[j].height <= slots[i].y;
                    REQUIRE(apart);
                }
            }
        }
    }
}

TEST_CASE("Layout grid slots are row-major", "[layout][policy]")
{
    auto slots = LayoutPreset::grid(3, 2).compute_slots({ 0, 0, 900, 600 }, 0);

    REQUIRE(slots.size() == 6);
    REQUIRE(slots[1].x > slots[0].x);
    REQUIRE(slots[1].y == slots[0].y);
    REQUIRE(slots[3].x == slots[0].x);
    REQUIRE(slots[3].y > slots[0].y);
}

TEST_CASE("Layout columns and rows tile one axis", "[layout][policy]")
{
    auto cols = LayoutPreset::columns(3).compute_slots({ 0, 0, 1000, 500 }, 5);
    REQUIRE(cols.size() == 3);
    REQUIRE(cols[0] == Rect{ 0, 0, 330, 500 });
    REQUIRE(cols[1] == Rect{ 335, 0, 330, 500 });
    REQUIRE(cols[2] == Rect{ 670, 0, 330, 500 });

    auto rows = LayoutPreset::rows_of(2).compute_slots({ 10, 20, 800, 600 }, 0);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == Rect{ 10, 20, 800, 300 });
    REQUIRE(rows[1] == Rect{ 10, 320, 800, 300 });
}

TEST_CASE("Layout left-right and top-bottom split in halves", "[layout][policy]")
{
    auto lr = LayoutPreset::left_right().compute_slots({ 0, 0, 1001, 400 }, 1);
    REQUIRE(lr[0] == Rect{ 0, 0, 500, 400 });
    REQUIRE(lr[1] == Rect{ 501, 0, 500, 400 });

    auto tb = LayoutPreset::top_bottom().compute_slots({ 0, 0, 400, 810 }, 10);
    REQUIRE(tb[0] == Rect{ 0, 0, 400, 400 });
    REQUIRE(tb[1] == Rect{ 0, 410, 400, 400 });
}

TEST_CASE("Layout main-side puts the primary slot first", "[layout][policy]")
{
    auto slots = LayoutPreset::main_side(2).compute_slots({ 0, 0, 1210, 810 }, 10);

    REQUIRE(slots.size() == 3);
    REQUIRE(slots[0] == Rect{ 0, 0, 800, 810 });
    REQUIRE(slots[1] == Rect{ 810, 0, 400, 400 });
    REQUIRE(slots[2] == Rect{ 810, 410, 400, 400 });
}

TEST_CASE("Layout focus uses a three-quarter primary slot", "[layout][policy]")
{
    auto slots = LayoutPreset::focus(3).compute_slots({ 0, 0, 1604, 900 }, 4);

    REQUIRE(slots.size() == 4);
    REQUIRE(slots[0].width == 1200);
    REQUIRE(slots[1].x == 1204);
    REQUIRE(slots[1].width == 400);
    REQUIRE(slots[1].height == 297);
    REQUIRE(slots[3].y == 2 * (297 + 4));
}

TEST_CASE("Layout display names describe the preset", "[layout][policy]")
{
    REQUIRE(LayoutPreset::grid(2, 3).display_name() == "2x3 Grid");
    REQUIRE(LayoutPreset::columns(4).display_name() == "4 Columns");
    REQUIRE(LayoutPreset::left_right().display_name() == "Left / Right");
    REQUIRE(LayoutPreset::main_side(2).display_name() == "Main + 2 Side");
    REQUIRE(LayoutPreset::focus(3).display_name() == "Focus + 3 Side");
}

TEST_CASE("Layout preset strings parse back to the same preset", "[layout][policy]")
{
    for (auto const& builtin : builtin_presets())
    {
        auto reparsed = LayoutPreset::parse(builtin.preset.spec_string());
        REQUIRE(reparsed.has_value());
        REQUIRE(*reparsed == builtin.preset);
    }
}

TEST_CASE("Layout builtin catalogue names match display names", "[layout][policy]")
{
    auto presets = builtin_presets();
    REQUIRE(presets.size() == 21);
    for (auto const& builtin : presets)
    {
        REQUIRE(builtin.name == builtin.preset.display_name());
    }
}
