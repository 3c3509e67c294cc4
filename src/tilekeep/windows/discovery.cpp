#include "discovery.hpp"
#include "category.hpp"
#include "tilekeep/core/log.hpp"
#include <algorithm>
#include <array>

namespace tilekeep {

namespace {

constexpr std::array<std::string_view, 38> SYSTEM_PROCESSES = {
    "plasmashell",
    "gnome-shell",
    "krunner",
    "xfce4-panel",
    "xfdesktop",
    "xfce4-notifyd",
    "lxpanel",
    "lxqt-panel",
    "mate-panel",
    "budgie-panel",
    "cinnamon",
    "polybar",
    "tint2",
    "waybar",
    "lemonbar",
    "plank",
    "docky",
    "cairo-dock",
    "conky",
    "dunst",
    "notify-osd",
    "picom",
    "compton",
    "stalonetray",
    "trayer",
    "nm-applet",
    "blueman-applet",
    "ibus-ui-gtk3",
    "ibus-x11",
    "fcitx5",
    "xscreensaver",
    "light-locker",
    "rofi",
    "dmenu",
    "ulauncher",
    "albert",
    "nemo-desktop",
    "desktop-icons",
};

constexpr std::array<std::string_view, 12> SYSTEM_CLASSES = {
    "desktop_window",
    "xfdesktop",
    "plasmashell",
    "gnome-shell",
    "conky",
    "polybar",
    "tint2",
    "plank",
    "dunst",
    "rofi",
    "trayer",
    "stalonetray",
};

constexpr std::array<std::string_view, 7> DESKTOP_FILE_MANAGERS = {
    "nautilus", "nemo", "caja", "pcmanfm", "pcmanfm-qt", "thunar", "spacefm",
};

constexpr std::array<std::string_view, 8> FILE_MANAGER_CLASSES = {
    "nautilus", "org.gnome.nautilus", "nemo", "caja", "pcmanfm", "pcmanfm-qt", "thunar", "spacefm",
};

constexpr std::array<std::string_view, 6> DESKTOP_INSTANCES = {
    "desktop_window", "desktop", "x-nautilus-desktop", "x-caja-desktop", "nemo-desktop", "pcmanfm-desktop",
};

template<size_t N>
bool contains(std::array<std::string_view, N> const& table, std::string_view value)
{
    return std::ranges::find(table, value) != table.end();
}

}

TargetFilter TargetFilter::custom(std::vector<std::string> names)
{
    for (auto& name : names)
        name = to_lower(name);
    return TargetFilter(Mode::Custom, std::move(names));
}

TargetFilter TargetFilter::from_string(std::string_view spec)
{
    std::string lower = to_lower(spec);
    if (lower == "terminal" || lower == "terminals" || lower == "term")
        return terminals();
    if (lower == "all" || lower == "universal")
        return universal();

    std::vector<std::string> names;
    size_t start = 0;
    while (start <= lower.size())
    {
        size_t end = lower.find(',', start);
        if (end == std::string::npos)
            end = lower.size();

        std::string name = lower.substr(start, end - start);
        auto first = name.find_first_not_of(" \t");
        auto last = name.find_last_not_of(" \t");
        if (first != std::string::npos)
            names.push_back(name.substr(first, last - first + 1));

        start = end + 1;
    }

    if (names.empty())
        return universal();
    return TargetFilter(Mode::Custom, std::move(names));
}

char const* TargetFilter::display_name() const
{
    switch (mode_)
    {
        case Mode::Terminals:
            return "Terminals";
        case Mode::Universal:
            return "Universal";
        case Mode::Custom:
            break;
    }
    return "Custom";
}

bool TargetFilter::matches(std::string_view process_name) const
{
    switch (mode_)
    {
        case Mode::Terminals:
            return is_terminal_process(process_name);
        case Mode::Universal:
            return true;
        case Mode::Custom:
            break;
    }
    std::string lower = to_lower(process_name);
    return std::ranges::find(names_, lower) != names_.end();
}

namespace discovery_policy {

bool is_system_process(std::string_view lower_process_name)
{
    return contains(SYSTEM_PROCESSES, lower_process_name);
}

bool is_system_window_class(WindowClass const& wm_class)
{
    return contains(SYSTEM_CLASSES, to_lower(wm_class.class_name))
        || contains(SYSTEM_CLASSES, to_lower(wm_class.instance_name));
}

bool is_desktop_hosting_file_manager(std::string_view lower_process_name)
{
    return contains(DESKTOP_FILE_MANAGERS, lower_process_name);
}

bool is_file_manager_window(WindowClass const& wm_class)
{
    if (contains(DESKTOP_INSTANCES, to_lower(wm_class.instance_name)))
        return false;
    return contains(FILE_MANAGER_CLASSES, to_lower(wm_class.class_name));
}

} // namespace discovery_policy

std::vector<ManagedWindow> discover(
    WindowSystem& ws,
    TargetFilter const& filter,
    WindowId self,
    std::span<std::string const> extra_exclusions
)
{
    std::vector<ManagedWindow> results;
    bool universal = filter.mode() == TargetFilter::Mode::Universal;

    for (WindowId window : ws.top_level_windows())
    {
        if (window == self)
            continue;

        if (!ws.is_visible(window))
            continue;

        if (ws.is_tool_window(window))
        {
            LOG_TRACE("Skipping {:#x}: tool window", window);
            continue;
        }

        auto rect = ws.frame_rect(window);
        if (!rect || rect->width <= 0 || rect->height <= 0)
            continue;

        auto process_name = ws.process_name(window);
        if (!process_name || process_name->empty())
        {
            LOG_TRACE("Skipping {:#x}: owning process unknown", window);
            continue;
        }

        std::string lower = to_lower(*process_name);

        if (std::ranges::find(extra_exclusions, lower) != extra_exclusions.end())
        {
            LOG_TRACE("Skipping {:#x}: '{}' excluded by configuration", window, lower);
            continue;
        }

        if (universal)
        {
            if (discovery_policy::is_system_process(lower))
                continue;

            auto wm_class = ws.window_class(window);
            if (wm_class && discovery_policy::is_system_window_class(*wm_class))
                continue;

            // Only browsing windows of desktop-drawing file managers are arranged
            if (discovery_policy::is_desktop_hosting_file_manager(lower)
                && (!wm_class || !discovery_policy::is_file_manager_window(*wm_class)))
                continue;
        }

        if (!filter.matches(*process_name))
            continue;

        ManagedWindow managed;
        managed.id = window;
        managed.title = ws.title(window);
        managed.process_name = *process_name;
        managed.category = categorize(*process_name);
        managed.rect = *rect;
        managed.is_minimized = ws.is_minimized(window);

        LOG_TRACE(
            "Discovered {:#x} '{}' ({}, {})",
            window,
            managed.title,
            managed.process_name,
            category_display_name(managed.category)
        );
        results.push_back(std::move(managed));
    }

    LOG_DEBUG("Discovered {} windows with filter {}", results.size(), filter.display_name());
    return results;
}

} // namespace tilekeep
