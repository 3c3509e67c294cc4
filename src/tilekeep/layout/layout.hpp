#pragma once

#include "tilekeep/core/types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tilekeep {

/**
 * @brief A parameterized recipe for an ordered list of slots.
 *
 * Slot order:
 * - Grid: row-major
 * - Columns / LeftRight: left to right
 * - Rows / TopBottom: top to bottom
 * - MainSide / Focus: primary slot first, then the side stack top to bottom
 */
struct LayoutPreset
{
    enum class Kind
    {
        Grid,
        Columns,
        Rows,
        LeftRight,
        TopBottom,
        MainSide,
        Focus
    };

    Kind kind = Kind::Grid;
    uint32_t cols = 0;  ///< Grid only
    uint32_t rows = 0;  ///< Grid only
    uint32_t count = 0; ///< Columns/Rows: number of slots; MainSide/Focus: side slots

    /// Upper bound for cols, rows and count; larger presets produce no slots.
    static constexpr uint32_t MAX_COUNT = 256;

    static LayoutPreset grid(uint32_t cols, uint32_t rows) { return { Kind::Grid, cols, rows, 0 }; }
    static LayoutPreset columns(uint32_t n) { return { Kind::Columns, 0, 0, n }; }
    static LayoutPreset rows_of(uint32_t n) { return { Kind::Rows, 0, 0, n }; }
    static LayoutPreset left_right() { return { Kind::LeftRight, 0, 0, 0 }; }
    static LayoutPreset top_bottom() { return { Kind::TopBottom, 0, 0, 0 }; }
    static LayoutPreset main_side(uint32_t side_count) { return { Kind::MainSide, 0, 0, side_count }; }
    static LayoutPreset focus(uint32_t side_count) { return { Kind::Focus, 0, 0, side_count }; }

    /**
     * @brief Parse a layout string
     *
     * Accepted forms (case-insensitive, surrounding whitespace ignored):
     *   "<cols>x<rows>", "columns:<n>", "rows:<n>", "left-right" | "split",
     *   "top-bottom", "main-side[:n]" (default 2), "focus[:n]" (default 3).
     * A space may replace the colon. Zero counts and counts above MAX_COUNT
     * are rejected.
     *
     * @return The preset, or nullopt for anything unrecognized
     */
    static std::optional<LayoutPreset> parse(std::string_view spec);

    size_t slot_count() const;

    /**
     * @brief Tile an area into slots separated by gap pixels
     *
     * Spans are computed with integer division; leftover pixels are left
     * unused at the right/bottom edge. Empty if any dimension exceeds MAX_COUNT.
     */
    std::vector<Slot> compute_slots(Rect const& area, int32_t gap) const;

    /// Human-readable name, e.g. "2x3 Grid" or "Main + 2 Side".
    std::string display_name() const;

    /// Canonical string accepted by parse(), e.g. "2x3" or "main-side:2".
    std::string spec_string() const;

    bool operator==(LayoutPreset const&) const = default;
};

struct NamedPreset
{
    std::string name;
    LayoutPreset preset;
};

/// The built-in preset catalogue, in menu order.
std::vector<NamedPreset> builtin_presets();

namespace layout_policy {

/**
 * @brief Grid slots with independently sized columns and rows.
 *
 * Each column (row) spans usable × weight pixels, truncated; the last column
 * (row) absorbs the remainder so spans always add up to the usable extent.
 * A weight list whose length does not match the axis count, or that holds a
 * weight outside (0, 1], is replaced by uniform weights. Empty if cols or
 * rows exceed LayoutPreset::MAX_COUNT.
 */
std::vector<Slot> compute_weighted_grid(
    uint32_t cols,
    uint32_t rows,
    Rect const& area,
    int32_t gap,
    std::span<float const> col_weights,
    std::span<float const> row_weights
);

std::vector<float> uniform_weights(uint32_t n);

/// True if every weight is within 0.001 of 1/n (and there are exactly n of them).
bool weights_are_uniform(std::span<float const> weights, uint32_t n);

} // namespace layout_policy

} // namespace tilekeep
