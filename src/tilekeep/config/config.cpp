#include "config.hpp"
#include "tilekeep/core/log.hpp"
#include "tilekeep/core/paths.hpp"
#include "tilekeep/windows/category.hpp"
#include <cmath>
#include <toml++/toml.hpp>

namespace tilekeep {

namespace {

std::vector<float> read_weights(toml::node_view<toml::node const> node)
{
    std::vector<float> weights;
    if (auto arr = node.as_array())
    {
        for (auto const& item : *arr)
        {
            // A dropped entry leaves the list short, so the grid falls back to uniform
            if (auto v = item.value<double>(); v && std::isfinite(*v) && *v > 0.0 && *v <= 1.0)
                weights.push_back(static_cast<float>(*v));
        }
    }
    return weights;
}

std::vector<size_t> read_indices(toml::node_view<toml::node const> node)
{
    std::vector<size_t> indices;
    if (auto arr = node.as_array())
    {
        for (auto const& item : *arr)
        {
            if (auto v = item.value<int64_t>(); v && *v >= 0)
                indices.push_back(static_cast<size_t>(*v));
        }
    }
    return indices;
}

std::optional<uint32_t> read_count(toml::node_view<toml::node const> node)
{
    if (auto v = node.value<int64_t>(); v && *v > 0 && *v <= LayoutPreset::MAX_COUNT)
        return static_cast<uint32_t>(*v);
    return std::nullopt;
}

std::optional<GridWeights> weights_if_custom(
    uint32_t cols,
    uint32_t rows,
    std::vector<float> const& col_weights,
    std::vector<float> const& row_weights
)
{
    bool custom_cols = col_weights.size() == cols && !layout_policy::weights_are_uniform(col_weights, cols);
    bool custom_rows = row_weights.size() == rows && !layout_policy::weights_are_uniform(row_weights, rows);
    if (!custom_cols && !custom_rows)
        return std::nullopt;

    return GridWeights{
        col_weights.size() == cols ? col_weights : layout_policy::uniform_weights(cols),
        row_weights.size() == rows ? row_weights : layout_policy::uniform_weights(rows),
    };
}

}

std::vector<std::string> CategoriesConfig::excluded_lower() const
{
    std::vector<std::string> result;
    result.reserve(excluded.size());
    for (auto const& name : excluded)
        result.push_back(to_lower(name));
    return result;
}

std::optional<LayoutPreset> LayoutDef::to_preset() const
{
    if (grid)
        return LayoutPreset::parse(*grid);

    if (!style)
        return std::nullopt;

    uint32_t n = count.value_or(2);
    std::string s = to_lower(*style);
    if (s == "columns")
        return LayoutPreset::columns(n);
    if (s == "rows")
        return LayoutPreset::rows_of(n);
    if (s == "left-right")
        return LayoutPreset::left_right();
    if (s == "top-bottom")
        return LayoutPreset::top_bottom();
    if (s == "main-side")
        return LayoutPreset::main_side(n);
    if (s == "focus")
        return LayoutPreset::focus(n);
    return std::nullopt;
}

Config default_config() { return Config{}; }

std::optional<std::filesystem::path> config_path()
{
    auto base = paths::config_home();
    if (!base)
        return std::nullopt;
    return *base / "tilekeep" / "config.toml";
}

std::optional<Config> load_config(std::filesystem::path const& path)
{
    try
    {
        toml::table const tbl = toml::parse_file(path.string());
        Config cfg = default_config();

        // Defaults
        if (auto defaults = tbl["defaults"].as_table())
        {
            Defaults& d = cfg.defaults;
            if (auto v = (*defaults)["target"].value<std::string>())
                d.target = *v;
            if (auto v = (*defaults)["monitor"].value<std::string>())
                d.monitor = *v;
            if (auto v = (*defaults)["gap"].value<int64_t>())
            {
                if (*v >= 0)
                    d.gap = static_cast<int32_t>(*v);
                else
                    LOG_WARN("Ignoring negative gap {}", *v);
            }
            if (auto v = (*defaults)["smart_sort"].value<bool>())
                d.smart_sort = *v;
            if (auto v = (*defaults)["decay_half_life_days"].value<double>())
            {
                if (*v > 0.0)
                    d.decay_half_life_days = *v;
                else
                    LOG_WARN("Ignoring non-positive decay_half_life_days {}", *v);
            }
            if (auto v = (*defaults)["use_custom"].value<bool>())
                d.use_custom = *v;
            if (auto v = read_count((*defaults)["custom_cols"]))
                d.custom_cols = *v;
            if (auto v = read_count((*defaults)["custom_rows"]))
                d.custom_rows = *v;
            d.col_weights = read_weights((*defaults)["col_weights"]);
            d.row_weights = read_weights((*defaults)["row_weights"]);
            d.disabled_cells = read_indices((*defaults)["disabled_cells"]);
        }

        // Categories
        if (auto categories = tbl["categories"].as_table())
        {
            if (auto excluded = (*categories)["excluded"].as_array())
            {
                cfg.categories.excluded.clear();
                for (auto const& item : *excluded)
                {
                    if (auto v = item.value<std::string>())
                        cfg.categories.excluded.push_back(*v);
                }
            }
        }

        // Named layouts
        if (auto layouts = tbl["layout"].as_array())
        {
            for (auto const& item : *layouts)
            {
                auto entry = item.as_table();
                if (!entry)
                    continue;

                LayoutDef def;
                if (auto v = (*entry)["name"].value<std::string>())
                    def.name = *v;
                if (auto v = (*entry)["grid"].value<std::string>())
                    def.grid = *v;
                if (auto v = (*entry)["style"].value<std::string>())
                    def.style = *v;
                def.count = read_count((*entry)["count"]);

                if (def.name.empty() || !def.to_preset())
                {
                    LOG_WARN("Ignoring invalid layout '{}'", def.name);
                    continue;
                }
                cfg.layouts.push_back(std::move(def));
            }
        }

        // Saved weighted grids
        if (auto grids = tbl["saved_grid"].as_array())
        {
            for (auto const& item : *grids)
            {
                auto entry = item.as_table();
                if (!entry)
                    continue;

                SavedGrid grid;
                if (auto v = (*entry)["name"].value<std::string>())
                    grid.name = *v;
                if (auto v = read_count((*entry)["cols"]))
                    grid.cols = *v;
                if (auto v = read_count((*entry)["rows"]))
                    grid.rows = *v;
                grid.col_weights = read_weights((*entry)["col_weights"]);
                grid.row_weights = read_weights((*entry)["row_weights"]);
                grid.disabled_cells = read_indices((*entry)["disabled_cells"]);

                if (grid.name.empty())
                {
                    LOG_WARN("Ignoring saved grid without a name");
                    continue;
                }
                cfg.saved_grids.push_back(std::move(grid));
            }
        }

        // Pin rules
        if (auto pins = tbl["pin"].as_array())
        {
            for (auto const& item : *pins)
            {
                auto entry = item.as_table();
                if (!entry)
                    continue;

                PinRule rule;
                if (auto v = (*entry)["process"].value<std::string>())
                    rule.process = *v;
                if (auto v = (*entry)["title"].value<std::string>())
                    rule.title = *v;
                if (auto v = (*entry)["slot"].value<int64_t>(); v && *v >= 0)
                {
                    rule.slot = static_cast<size_t>(*v);
                }
                else
                {
                    LOG_WARN("Ignoring pin rule without a valid slot");
                    continue;
                }
                cfg.pins.push_back(std::move(rule));
            }
        }

        LOG_DEBUG(
            "Config: {} layouts, {} saved grids, {} pin rules",
            cfg.layouts.size(),
            cfg.saved_grids.size(),
            cfg.pins.size()
        );
        return cfg;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error in {}: {}", path.string(), err.description());
        return std::nullopt;
    }
}

std::optional<NamedLayout> find_named_layout(Config const& config, std::string_view name)
{
    std::string wanted = to_lower(name);

    for (auto const& def : config.layouts)
    {
        if (to_lower(def.name) != wanted)
            continue;
        if (auto preset = def.to_preset())
            return NamedLayout{ def.name, *preset, std::nullopt, {} };
    }

    for (auto const& grid : config.saved_grids)
    {
        if (to_lower(grid.name) != wanted)
            continue;
        return NamedLayout{
            grid.name,
            LayoutPreset::grid(grid.cols, grid.rows),
            weights_if_custom(grid.cols, grid.rows, grid.col_weights, grid.row_weights),
            grid.disabled_cells,
        };
    }

    for (auto const& builtin : builtin_presets())
    {
        if (to_lower(builtin.name) == wanted)
            return NamedLayout{ builtin.name, builtin.preset, std::nullopt, {} };
    }

    return std::nullopt;
}

std::optional<NamedLayout> default_layout(Config const& config)
{
    Defaults const& d = config.defaults;
    if (!d.use_custom)
        return std::nullopt;

    return NamedLayout{
        "Custom",
        LayoutPreset::grid(d.custom_cols, d.custom_rows),
        weights_if_custom(d.custom_cols, d.custom_rows, d.col_weights, d.row_weights),
        d.disabled_cells,
    };
}

} // namespace tilekeep
