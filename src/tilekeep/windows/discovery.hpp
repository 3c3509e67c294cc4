#pragma once

#include "tilekeep/core/types.hpp"
#include "tilekeep/core/window_system.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tilekeep {

/**
 * @brief Which windows an arrangement pass targets.
 *
 * - Terminals: the fixed list of terminal emulators
 * - Universal: every application window, minus desktop-shell components
 * - Custom: an explicit list of process names
 */
class TargetFilter
{
public:
    enum class Mode
    {
        Terminals,
        Universal,
        Custom
    };

    static TargetFilter terminals() { return TargetFilter(Mode::Terminals, {}); }
    static TargetFilter universal() { return TargetFilter(Mode::Universal, {}); }
    static TargetFilter custom(std::vector<std::string> names);

    /**
     * @brief Build a filter from its configuration string
     *
     * "terminal"/"terminals"/"term" and "all"/"universal" select the built-in
     * modes. Anything else is a comma-separated process list; an empty list
     * means Universal.
     */
    static TargetFilter from_string(std::string_view spec);

    Mode mode() const { return mode_; }
    std::vector<std::string> const& names() const { return names_; }
    char const* display_name() const;

    /// Name match only; Universal exclusions are applied during discovery.
    bool matches(std::string_view process_name) const;

    bool operator==(TargetFilter const&) const = default;

private:
    TargetFilter(Mode mode, std::vector<std::string> names)
        : mode_(mode)
        , names_(std::move(names))
    { }

    Mode mode_;
    std::vector<std::string> names_; // lowercase, Custom only
};

namespace discovery_policy {

/// Desktop-shell processes (panels, docks, launchers, notifiers) never arranged in Universal mode.
bool is_system_process(std::string_view lower_process_name);

/// WM_CLASS values that identify desktop-shell surfaces.
bool is_system_window_class(WindowClass const& wm_class);

/// File managers that can also draw the desktop background.
bool is_desktop_hosting_file_manager(std::string_view lower_process_name);

/// True if WM_CLASS marks a browsing window rather than the desktop surface.
bool is_file_manager_window(WindowClass const& wm_class);

} // namespace discovery_policy

/**
 * @brief Enumerate arrangeable windows.
 *
 * Windows are emitted in the order the window system reports them.
 *
 * @param ws Window system to query
 * @param filter Target filter
 * @param self Caller's own window, never emitted (NO_WINDOW if none)
 * @param extra_exclusions Lowercase process names to skip
 */
std::vector<ManagedWindow> discover(
    WindowSystem& ws,
    TargetFilter const& filter,
    WindowId self,
    std::span<std::string const> extra_exclusions
);

} // namespace tilekeep
