#include "tilekeep/layout/layout.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <limits>
#include <vector>

using namespace tilekeep;

TEST_CASE("Weighted grid spans add up to the usable extent", "[layout][weights]")
{
    Rect area{ 0, 0, 1000, 700 };
    std::vector<float> cols{ 0.6f, 0.4f };
    std::vector<float> rows{ 0.3f, 0.3f, 0.4f };

    auto slots = layout_policy::compute_weighted_grid(2, 3, area, 10, cols, rows);

    REQUIRE(slots.size() == 6);
    // Row 0: both columns
    REQUIRE(slots[0].width + slots[1].width + 10 == area.width);
    // Column 0: all rows
    REQUIRE(slots[0].height + slots[2].height + slots[4].height + 2 * 10 == area.height);
    // Last column ends exactly at the right edge
    REQUIRE(slots[1].x + slots[1].width == area.x + area.width);
    REQUIRE(slots[5].y + slots[5].height == area.y + area.height);
}

TEST_CASE("Weighted grid honours individual fractions", "[layout][weights]")
{
    Rect area{ 100, 0, 1010, 500 };
    std::vector<float> cols{ 0.75f, 0.25f };
    std::vector<float> rows{ 1.0f };

    auto slots = layout_policy::compute_weighted_grid(2, 1, area, 10, cols, rows);

    REQUIRE(slots.size() == 2);
    REQUIRE(slots[0] == Rect{ 100, 0, 750, 500 });
    REQUIRE(slots[1] == Rect{ 860, 0, 250, 500 });
}

TEST_CASE("Weighted grid gives residual pixels to the last column", "[layout][weights]")
{
    Rect area{ 0, 0, 100, 100 };
    std::vector<float> thirds{ 1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 3.0f };
    std::vector<float> one{ 1.0f };

    auto slots = layout_policy::compute_weighted_grid(3, 1, area, 0, thirds, one);

    REQUIRE(slots[0].width == 33);
    REQUIRE(slots[1].width == 33);
    REQUIRE(slots[2].width == 34);
    REQUIRE(slots[2].x == 66);
}

TEST_CASE("Weighted grid with uniform weights matches the plain grid", "[layout][weights]")
{
    Rect area{ 0, 0, 1920, 1080 };
    int32_t gap = 8;

    for (uint32_t cols = 1; cols <= 4; ++cols)
    {
        for (uint32_t rows = 1; rows <= 4; ++rows)
        {
            auto plain = LayoutPreset::grid(cols, rows).compute_slots(area, gap);
            auto weighted = layout_policy::compute_weighted_grid(
                cols,
                rows,
                area,
                gap,
                layout_policy::uniform_weights(cols),
                layout_policy::uniform_weights(rows)
            );

            REQUIRE(weighted.size() == plain.size());
            for (size_t i = 0; i < plain.size(); ++i)
            {
                // The weighted grid hands truncation leftovers to the last column/row
                REQUIRE(std::abs(weighted[i].x - plain[i].x) <= 1);
                REQUIRE(std::abs(weighted[i].y - plain[i].y) <= 1);
                REQUIRE(weighted[i].width >= plain[i].width - 1);
                REQUIRE(weighted[i].height >= plain[i].height - 1);
            }
        }
    }
}

TEST_CASE("Weighted grid falls back to uniform weights on length mismatch", "[layout][weights]")
{
    Rect area{ 0, 0, 1000, 1000 };
    std::vector<float> wrong{ 0.9f };

    auto slots = layout_policy::compute_weighted_grid(2, 2, area, 0, wrong, wrong);

    REQUIRE(slots.size() == 4);
    REQUIRE(slots[0] == Rect{ 0, 0, 500, 500 });
    REQUIRE(slots[3] == Rect{ 500, 500, 500, 500 });
}

TEST_CASE("Weighted grid falls back to uniform weights outside (0, 1]", "[layout][weights]")
{
    Rect area{ 0, 0, 1000, 1000 };
    std::vector<float> even{ 0.5f, 0.5f };
    std::vector<float> nan{ std::numeric_limits<float>::quiet_NaN(), 0.5f };
    std::vector<float> inf{ 0.5f, std::numeric_limits<float>::infinity() };
    std::vector<float> huge{ 1e30f, 0.5f };
    std::vector<float> negative{ -0.5f, 1.0f };

    auto uniform = layout_policy::compute_weighted_grid(2, 2, area, 10, even, even);

    REQUIRE(layout_policy::compute_weighted_grid(2, 2, area, 10, nan, even) == uniform);
    REQUIRE(layout_policy::compute_weighted_grid(2, 2, area, 10, even, inf) == uniform);
    REQUIRE(layout_policy::compute_weighted_grid(2, 2, area, 10, huge, huge) == uniform);
    REQUIRE(layout_policy::compute_weighted_grid(2, 2, area, 10, negative, even) == uniform);
}

TEST_CASE("Weighted grid above the count limit produces no slots", "[layout][weights]")
{
    Rect area{ 0, 0, 1000, 1000 };
    REQUIRE(layout_policy::compute_weighted_grid(LayoutPreset::MAX_COUNT + 1, 1, area, 0, {}, {}).empty());
    REQUIRE(layout_policy::compute_weighted_grid(1, 100000, area, 0, {}, {}).empty());
}

TEST_CASE("Weight uniformity uses a small tolerance", "[layout][weights]")
{
    REQUIRE(layout_policy::weights_are_uniform(layout_policy::uniform_weights(3), 3));

    std::vector<float> near{ 0.5004f, 0.4996f };
    REQUIRE(layout_policy::weights_are_uniform(near, 2));

    std::vector<float> skewed{ 0.6f, 0.4f };
    REQUIRE_FALSE(layout_policy::weights_are_uniform(skewed, 2));

    std::vector<float> short_list{ 1.0f };
    REQUIRE_FALSE(layout_policy::weights_are_uniform(short_list, 2));

    REQUIRE(layout_policy::uniform_weights(0).empty());
}
