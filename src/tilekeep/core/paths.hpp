#pragma once

#include <cstdlib>
#include <filesystem>
#include <optional>

namespace tilekeep::paths {

/**
 * @brief Resolve an XDG base directory.
 *
 * Uses $xdg_var when set to an absolute path, else $HOME/home_fallback.
 *
 * @return nullopt if neither variable is usable
 */
inline std::optional<std::filesystem::path> xdg_base(char const* xdg_var, char const* home_fallback)
{
    if (char const* xdg = std::getenv(xdg_var); xdg && xdg[0] == '/')
        return std::filesystem::path(xdg);

    if (char const* home = std::getenv("HOME"); home && home[0] != '\0')
        return std::filesystem::path(home) / home_fallback;

    return std::nullopt;
}

inline std::optional<std::filesystem::path> config_home() { return xdg_base("XDG_CONFIG_HOME", ".config"); }

inline std::optional<std::filesystem::path> data_home() { return xdg_base("XDG_DATA_HOME", ".local/share"); }

} // namespace tilekeep::paths
