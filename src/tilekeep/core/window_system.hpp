#pragma once

#include "tilekeep/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tilekeep {

/**
 * @brief Outcome of a move/resize request.
 *
 * error is a human-readable reason, only meaningful when ok is false.
 */
struct MoveResult
{
    bool ok = true;
    std::string error;

    static MoveResult success() { return {}; }
    static MoveResult failure(std::string reason) { return { false, std::move(reason) }; }
};

/**
 * @brief Display server operations used by discovery, monitor resolution,
 * the activity sampler and the arrangement pass.
 *
 * Attribute queries are independent so callers can stop probing a window as
 * soon as one check rejects it. Every query is soft: an unreadable attribute
 * yields nullopt, false or an empty string, never an exception.
 *
 * Implementations are not required to be thread-safe; each thread owns its
 * own instance.
 */
class WindowSystem
{
public:
    virtual ~WindowSystem() = default;

    /// Displays with their usable (dock-free) area. Empty if none are reported.
    virtual std::vector<MonitorInfo> monitors() = 0;

    /// Top-level application windows, in the order the server reports them.
    virtual std::vector<WindowId> top_level_windows() = 0;

    virtual bool is_visible(WindowId window) = 0;
    virtual bool is_tool_window(WindowId window) = 0;
    virtual std::optional<Rect> frame_rect(WindowId window) = 0;

    /// Image name of the owning process, without directory.
    virtual std::optional<std::string> process_name(WindowId window) = 0;

    virtual std::optional<WindowClass> window_class(WindowId window) = 0;
    virtual std::string title(WindowId window) = 0;
    virtual bool is_minimized(WindowId window) = 0;

    /// Current foreground window, if any.
    virtual std::optional<WindowId> active_window() = 0;

    /// Move and resize without raising or focusing the window.
    virtual MoveResult move_resize(WindowId window, Rect const& target) = 0;
};

} // namespace tilekeep
