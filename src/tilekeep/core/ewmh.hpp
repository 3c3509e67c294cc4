#pragma once

#include "connection.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace tilekeep {

enum class WindowType
{
    Desktop,
    Dock,
    Toolbar,
    Menu,
    Utility,
    Splash,
    Dialog,
    DropdownMenu,
    PopupMenu,
    Tooltip,
    Notification,
    Combo,
    Dnd,
    Normal
};

/**
 * @brief Whether an EWMH window type marks auxiliary UI rather than an
 * application window.
 *
 * Only NORMAL and DIALOG windows are candidates for arrangement; everything
 * else (panels, desktops, menus, tooltips, palettes) is treated like a
 * tool window.
 */
bool is_tool_window_type(WindowType type);

/// Frame decoration sizes from _NET_FRAME_EXTENTS.
struct FrameExtents
{
    uint32_t left = 0;
    uint32_t right = 0;
    uint32_t top = 0;
    uint32_t bottom = 0;
};

/**
 * @brief Client-side view of the EWMH properties maintained by the running
 * window manager.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    /// True if an EWMH-compliant window manager advertises itself.
    bool wm_present() const;

    // Root window properties
    std::optional<std::vector<xcb_window_t>> client_list() const;
    std::optional<xcb_window_t> active_window() const;

    // Per-window properties
    bool has_window_state(xcb_window_t window, xcb_atom_t state) const;
    xcb_atom_t get_window_type(xcb_window_t window) const;
    WindowType get_window_type_enum(xcb_window_t window) const;
    std::optional<uint32_t> get_pid(xcb_window_t window) const;
    std::optional<std::string> get_wm_name(xcb_window_t window) const;
    FrameExtents get_frame_extents(xcb_window_t window) const;

    // Strut support
    Strut get_window_strut(xcb_window_t window) const;

    // Client requests (sent to the window manager, never applied directly)
    void request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height);
    void request_unmaximize(xcb_window_t window);

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
};

} // namespace tilekeep
