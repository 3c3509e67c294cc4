#include "layout.hpp"
#include "tilekeep/windows/category.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace tilekeep {

namespace {

std::string_view trim(std::string_view s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<uint32_t> parse_count(std::string_view s)
{
    s = trim(s);
    if (s.empty())
        return std::nullopt;

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

bool within_bounds(uint32_t n) { return n > 0 && n <= LayoutPreset::MAX_COUNT; }

// "<prefix>", "<prefix>:<n>" or "<prefix> <n>" -> the part after the prefix
std::string_view argument_after(std::string_view s, std::string_view prefix)
{
    std::string_view rest = s.substr(prefix.size());
    while (!rest.empty() && rest.front() == ':')
        rest.remove_prefix(1);
    return trim(rest);
}

// Primary slot on the left, side_count stacked slots on the right
std::vector<Slot> main_and_stack(Rect const& area, int32_t gap, int32_t main_w, int32_t side_count)
{
    int32_t side_w = area.width - main_w - gap;
    int32_t side_h = (area.height - gap * (side_count - 1)) / side_count;

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(1 + side_count));
    slots.push_back({ area.x, area.y, main_w, area.height });
    for (int32_t i = 0; i < side_count; ++i)
    {
        slots.push_back({ area.x + main_w + gap, area.y + i * (side_h + gap), side_w, side_h });
    }
    return slots;
}

bool usable_weights(std::span<float const> weights, uint32_t n)
{
    if (weights.size() != n)
        return false;
    return std::ranges::all_of(weights, [](float w) { return std::isfinite(w) && w > 0.0f && w <= 1.0f; });
}

std::vector<int32_t> weighted_spans(int32_t usable, std::span<float const> weights)
{
    std::vector<int32_t> spans;
    spans.reserve(weights.size());
    for (float w : weights)
    {
        spans.push_back(static_cast<int32_t>(static_cast<float>(usable) * w));
    }

    // Give leftover pixels to the last entry
    if (!spans.empty())
    {
        int32_t sum = 0;
        for (int32_t s : spans)
            sum += s;
        spans.back() += usable - sum;
    }
    return spans;
}

std::vector<int32_t> offsets(int32_t origin, std::span<int32_t const> spans, int32_t gap)
{
    std::vector<int32_t> result;
    result.reserve(spans.size());
    int32_t pos = origin;
    for (size_t i = 0; i < spans.size(); ++i)
    {
        result.push_back(pos);
        if (i + 1 < spans.size())
            pos += spans[i] + gap;
    }
    return result;
}

}

std::optional<LayoutPreset> LayoutPreset::parse(std::string_view spec)
{
    std::string lowered = to_lower(trim(spec));
    std::string_view s = lowered;

    // "2x3", "3x2", etc.
    if (auto sep = s.find('x'); sep != std::string_view::npos)
    {
        auto cols = parse_count(s.substr(0, sep));
        auto rows = parse_count(s.substr(sep + 1));
        if (!cols || !rows)
            return std::nullopt;
        if (within_bounds(*cols) && within_bounds(*rows))
            return grid(*cols, *rows);
    }

    if (s.starts_with("columns"))
    {
        auto n = parse_count(argument_after(s, "columns"));
        if (!n)
            return std::nullopt;
        if (within_bounds(*n))
            return columns(*n);
    }

    if (s.starts_with("rows"))
    {
        auto n = parse_count(argument_after(s, "rows"));
        if (!n)
            return std::nullopt;
        if (within_bounds(*n))
            return rows_of(*n);
    }

    if (s == "left-right" || s == "leftright" || s == "split")
        return left_right();

    if (s == "top-bottom" || s == "topbottom")
        return top_bottom();

    for (std::string_view prefix : { std::string_view("main-side"), std::string_view("mainside") })
    {
        if (s.starts_with(prefix))
        {
            uint32_t n = parse_count(argument_after(s, prefix)).value_or(2);
            if (n > MAX_COUNT)
                return std::nullopt;
            return main_side(std::max<uint32_t>(n, 1));
        }
    }

    if (s.starts_with("focus"))
    {
        uint32_t n = parse_count(argument_after(s, "focus")).value_or(3);
        if (n > MAX_COUNT)
            return std::nullopt;
        return focus(std::max<uint32_t>(n, 1));
    }

    return std::nullopt;
}

size_t LayoutPreset::slot_count() const
{
    switch (kind)
    {
        case Kind::Grid:
            return static_cast<size_t>(cols) * rows;
        case Kind::Columns:
        case Kind::Rows:
            return count;
        case Kind::LeftRight:
        case Kind::TopBottom:
            return 2;
        case Kind::MainSide:
        case Kind::Focus:
            return 1 + static_cast<size_t>(count);
    }
    return 0;
}

std::vector<Slot> LayoutPreset::compute_slots(Rect const& area, int32_t gap) const
{
    if (cols > MAX_COUNT || rows > MAX_COUNT || count > MAX_COUNT)
        return {};

    switch (kind)
    {
        case Kind::Grid:
        {
            if (cols == 0 || rows == 0)
                return {};
            auto c = static_cast<int32_t>(cols);
            auto r = static_cast<int32_t>(rows);
            int32_t cell_w = (area.width - gap * (c - 1)) / c;
            int32_t cell_h = (area.height - gap * (r - 1)) / r;

            std::vector<Slot> slots;
            slots.reserve(slot_count());
            for (int32_t row = 0; row < r; ++row)
            {
                for (int32_t col = 0; col < c; ++col)
                {
                    slots.push_back({ area.x + col * (cell_w + gap), area.y + row * (cell_h + gap), cell_w, cell_h });
                }
            }
            return slots;
        }
        case Kind::Columns:
        {
            if (count == 0)
                return {};
            auto n = static_cast<int32_t>(count);
            int32_t col_w = (area.width - gap * (n - 1)) / n;

            std::vector<Slot> slots;
            slots.reserve(count);
            for (int32_t i = 0; i < n; ++i)
                slots.push_back({ area.x + i * (col_w + gap), area.y, col_w, area.height });
            return slots;
        }
        case Kind::Rows:
        {
            if (count == 0)
                return {};
            auto n = static_cast<int32_t>(count);
            int32_t row_h = (area.height - gap * (n - 1)) / n;

            std::vector<Slot> slots;
            slots.reserve(count);
            for (int32_t i = 0; i < n; ++i)
                slots.push_back({ area.x, area.y + i * (row_h + gap), area.width, row_h });
            return slots;
        }
        case Kind::LeftRight:
        {
            int32_t half_w = (area.width - gap) / 2;
            return {
                { area.x, area.y, half_w, area.height },
                { area.x + half_w + gap, area.y, half_w, area.height },
            };
        }
        case Kind::TopBottom:
        {
            int32_t half_h = (area.height - gap) / 2;
            return {
                { area.x, area.y, area.width, half_h },
                { area.x, area.y + half_h + gap, area.width, half_h },
            };
        }
        case Kind::MainSide:
            if (count == 0)
                return {};
            return main_and_stack(area, gap, (area.width - gap) * 2 / 3, static_cast<int32_t>(count));
        case Kind::Focus:
            if (count == 0)
                return {};
            return main_and_stack(area, gap, (area.width - gap) * 3 / 4, static_cast<int32_t>(count));
    }
    return {};
}

std::string LayoutPreset::display_name() const
{
    switch (kind)
    {
        case Kind::Grid:
            return std::to_string(cols) + "x" + std::to_string(rows) + " Grid";
        case Kind::Columns:
            return std::to_string(count) + " Columns";
        case Kind::Rows:
            return std::to_string(count) + " Rows";
        case Kind::LeftRight:
            return "Left / Right";
        case Kind::TopBottom:
            return "Top / Bottom";
        case Kind::MainSide:
            return "Main + " + std::to_string(count) + " Side";
        case Kind::Focus:
            return "Focus + " + std::to_string(count) + " Side";
    }
    return {};
}

std::string LayoutPreset::spec_string() const
{
    switch (kind)
    {
        case Kind::Grid:
            return std::to_string(cols) + "x" + std::to_string(rows);
        case Kind::Columns:
            return "columns:" + std::to_string(count);
        case Kind::Rows:
            return "rows:" + std::to_string(count);
        case Kind::LeftRight:
            return "left-right";
        case Kind::TopBottom:
            return "top-bottom";
        case Kind::MainSide:
            return "main-side:" + std::to_string(count);
        case Kind::Focus:
            return "focus:" + std::to_string(count);
    }
    return {};
}

std::vector<NamedPreset> builtin_presets()
{
    return {
        { "1x2 Grid", LayoutPreset::grid(1, 2) },
        { "2x1 Grid", LayoutPreset::grid(2, 1) },
        { "2x2 Grid", LayoutPreset::grid(2, 2) },
        { "2x3 Grid", LayoutPreset::grid(2, 3) },
        { "3x2 Grid", LayoutPreset::grid(3, 2) },
        { "3x3 Grid", LayoutPreset::grid(3, 3) },
        { "4x2 Grid", LayoutPreset::grid(4, 2) },
        { "4x3 Grid", LayoutPreset::grid(4, 3) },
        { "4x4 Grid", LayoutPreset::grid(4, 4) },
        { "Left / Right", LayoutPreset::left_right() },
        { "Top / Bottom", LayoutPreset::top_bottom() },
        { "Main + 2 Side", LayoutPreset::main_side(2) },
        { "Main + 3 Side", LayoutPreset::main_side(3) },
        { "Main + 4 Side", LayoutPreset::main_side(4) },
        { "Focus + 3 Side", LayoutPreset::focus(3) },
        { "Focus + 4 Side", LayoutPreset::focus(4) },
        { "2 Columns", LayoutPreset::columns(2) },
        { "3 Columns", LayoutPreset::columns(3) },
        { "4 Columns", LayoutPreset::columns(4) },
        { "2 Rows", LayoutPreset::rows_of(2) },
        { "3 Rows", LayoutPreset::rows_of(3) },
    };
}

namespace layout_policy {

std::vector<float> uniform_weights(uint32_t n)
{
    if (n == 0)
        return {};
    return std::vector<float>(n, 1.0f / static_cast<float>(n));
}

bool weights_are_uniform(std::span<float const> weights, uint32_t n)
{
    if (n == 0 || weights.size() != n)
        return false;
    float expected = 1.0f / static_cast<float>(n);
    return std::ranges::all_of(weights, [expected](float w) { return std::fabs(w - expected) < 0.001f; });
}

std::vector<Slot> compute_weighted_grid(
    uint32_t cols,
    uint32_t rows,
    Rect const& area,
    int32_t gap,
    std::span<float const> col_weights,
    std::span<float const> row_weights
)
{
    if (cols == 0 || rows == 0 || cols > LayoutPreset::MAX_COUNT || rows > LayoutPreset::MAX_COUNT)
        return {};

    std::vector<float> fallback_cols;
    if (!usable_weights(col_weights, cols))
    {
        fallback_cols = uniform_weights(cols);
        col_weights = fallback_cols;
    }
    std::vector<float> fallback_rows;
    if (!usable_weights(row_weights, rows))
    {
        fallback_rows = uniform_weights(rows);
        row_weights = fallback_rows;
    }

    int32_t usable_w = area.width - gap * (static_cast<int32_t>(cols) - 1);
    int32_t usable_h = area.height - gap * (static_cast<int32_t>(rows) - 1);

    std::vector<int32_t> col_widths = weighted_spans(usable_w, col_weights);
    std::vector<int32_t> row_heights = weighted_spans(usable_h, row_weights);
    std::vector<int32_t> col_x = offsets(area.x, col_widths, gap);
    std::vector<int32_t> row_y = offsets(area.y, row_heights, gap);

    std::vector<Slot> slots;
    slots.reserve(static_cast<size_t>(cols) * rows);
    for (size_t r = 0; r < rows; ++r)
    {
        for (size_t c = 0; c < cols; ++c)
        {
            slots.push_back({ col_x[c], row_y[r], col_widths[c], row_heights[r] });
        }
    }
    return slots;
}

} // namespace layout_policy

} // namespace tilekeep
