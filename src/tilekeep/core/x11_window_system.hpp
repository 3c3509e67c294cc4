#pragma once

#include "tilekeep/core/connection.hpp"
#include "tilekeep/core/ewmh.hpp"
#include "tilekeep/core/window_system.hpp"

namespace tilekeep {

/**
 * @brief WindowSystem backed by an X11 server.
 *
 * Reads the state published by an EWMH window manager and sends it
 * move/resize requests. Without a window manager the children of the root
 * window are enumerated and configured directly.
 *
 * Owns its own connection; create one instance per thread.
 */
class X11WindowSystem : public WindowSystem
{
public:
    X11WindowSystem();

    std::vector<MonitorInfo> monitors() override;
    std::vector<WindowId> top_level_windows() override;

    bool is_visible(WindowId window) override;
    bool is_tool_window(WindowId window) override;
    std::optional<Rect> frame_rect(WindowId window) override;
    std::optional<std::string> process_name(WindowId window) override;
    std::optional<WindowClass> window_class(WindowId window) override;
    std::string title(WindowId window) override;
    bool is_minimized(WindowId window) override;

    std::optional<WindowId> active_window() override;

    MoveResult move_resize(WindowId window, Rect const& target) override;

private:
    Connection conn_;
    Ewmh ewmh_;
    xcb_atom_t wm_state_ = XCB_NONE;

    std::vector<xcb_window_t> root_children();
    std::vector<Rect> detect_outputs(std::optional<size_t>& primary);
    bool has_iconic_wm_state(xcb_window_t window);
};

} // namespace tilekeep
