#pragma once

#include "tilekeep/arrange/arrange.hpp"
#include "tilekeep/layout/layout.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tilekeep {

struct Defaults
{
    std::string target = "all";
    std::string monitor = "primary";
    int32_t gap = 4;
    bool smart_sort = false;
    double decay_half_life_days = 7.0;

    // Custom grid used by `arrange` when no layout is named
    bool use_custom = false;
    uint32_t custom_cols = 2;
    uint32_t custom_rows = 2;
    std::vector<float> col_weights;
    std::vector<float> row_weights;
    std::vector<size_t> disabled_cells;
};

struct CategoriesConfig
{
    std::vector<std::string> excluded; // extra process exclusions

    std::vector<std::string> excluded_lower() const;
};

/// A user-named layout: either a parse string or a style with a count.
struct LayoutDef
{
    std::string name;
    std::optional<std::string> grid;
    std::optional<std::string> style;
    std::optional<uint32_t> count;

    std::optional<LayoutPreset> to_preset() const;
};

struct SavedGrid
{
    std::string name;
    uint32_t cols = 2;
    uint32_t rows = 2;
    std::vector<float> col_weights;
    std::vector<float> row_weights;
    std::vector<size_t> disabled_cells;
};

struct Config
{
    Defaults defaults;
    CategoriesConfig categories;
    std::vector<LayoutDef> layouts;
    std::vector<SavedGrid> saved_grids;
    std::vector<PinRule> pins;
};

/// Everything needed to arrange by name.
struct NamedLayout
{
    std::string name;
    LayoutPreset preset;
    std::optional<GridWeights> weights;
    std::vector<size_t> disabled_cells;
};

/// @return nullopt if the file cannot be parsed (the error is logged)
std::optional<Config> load_config(std::filesystem::path const& path);
Config default_config();

/// $XDG_CONFIG_HOME/tilekeep/config.toml, or ~/.config/tilekeep/config.toml.
std::optional<std::filesystem::path> config_path();

/**
 * @brief Look up a layout by name, ignoring case.
 *
 * Searches the configured layouts, then the saved grids, then the built-in
 * presets. Saved grids carry their weights (when not uniform) and disabled
 * cells.
 */
std::optional<NamedLayout> find_named_layout(Config const& config, std::string_view name);

/// The custom grid from [defaults], if use_custom is set.
std::optional<NamedLayout> default_layout(Config const& config);

} // namespace tilekeep
