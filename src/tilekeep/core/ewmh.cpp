#include "ewmh.hpp"
#include <stdexcept>

namespace tilekeep {

bool is_tool_window_type(WindowType type)
{
    return type != WindowType::Normal && type != WindowType::Dialog;
}

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }
}

Ewmh::~Ewmh() { xcb_ewmh_connection_wipe(&ewmh_); }

bool Ewmh::wm_present() const
{
    xcb_window_t check = XCB_NONE;
    if (!xcb_ewmh_get_supporting_wm_check_reply(
            &ewmh_,
            xcb_ewmh_get_supporting_wm_check(&ewmh_, conn_.root()),
            &check,
            nullptr
        ))
        return false;
    return check != XCB_NONE;
}

std::optional<std::vector<xcb_window_t>> Ewmh::client_list() const
{
    xcb_ewmh_get_windows_reply_t clients;
    if (!xcb_ewmh_get_client_list_reply(&ewmh_, xcb_ewmh_get_client_list(&ewmh_, 0), &clients, nullptr))
        return std::nullopt;

    std::vector<xcb_window_t> windows(clients.windows, clients.windows + clients.windows_len);
    xcb_ewmh_get_windows_reply_wipe(&clients);
    return windows;
}

std::optional<xcb_window_t> Ewmh::active_window() const
{
    xcb_window_t active = XCB_NONE;
    if (!xcb_ewmh_get_active_window_reply(&ewmh_, xcb_ewmh_get_active_window(&ewmh_, 0), &active, nullptr))
        return std::nullopt;
    if (active == XCB_NONE)
        return std::nullopt;
    return active;
}

bool Ewmh::has_window_state(xcb_window_t window, xcb_atom_t state) const
{
    xcb_ewmh_get_atoms_reply_t current_state;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current_state, nullptr))
        return false;

    bool found = false;
    for (uint32_t i = 0; i < current_state.atoms_len; ++i)
    {
        if (current_state.atoms[i] == state)
        {
            found = true;
            break;
        }
    }

    xcb_ewmh_get_atoms_reply_wipe(&current_state);
    return found;
}

xcb_atom_t Ewmh::get_window_type(xcb_window_t window) const
{
    xcb_ewmh_get_atoms_reply_t types;
    if (!xcb_ewmh_get_wm_window_type_reply(&ewmh_, xcb_ewmh_get_wm_window_type(&ewmh_, window), &types, nullptr))
        return XCB_ATOM_NONE;

    xcb_atom_t type = (types.atoms_len > 0) ? types.atoms[0] : XCB_ATOM_NONE;
    xcb_ewmh_get_atoms_reply_wipe(&types);
    return type;
}

WindowType Ewmh::get_window_type_enum(xcb_window_t window) const
{
    xcb_atom_t type = get_window_type(window);

    if (type == ewmh_._NET_WM_WINDOW_TYPE_DESKTOP)
        return WindowType::Desktop;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_DOCK)
        return WindowType::Dock;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_TOOLBAR)
        return WindowType::Toolbar;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_MENU)
        return WindowType::Menu;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_UTILITY)
        return WindowType::Utility;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_SPLASH)
        return WindowType::Splash;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_DIALOG)
        return WindowType::Dialog;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_DROPDOWN_MENU)
        return WindowType::DropdownMenu;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_POPUP_MENU)
        return WindowType::PopupMenu;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_TOOLTIP)
        return WindowType::Tooltip;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_NOTIFICATION)
        return WindowType::Notification;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_COMBO)
        return WindowType::Combo;
    if (type == ewmh_._NET_WM_WINDOW_TYPE_DND)
        return WindowType::Dnd;

    // Missing type means NORMAL per EWMH
    return WindowType::Normal;
}

std::optional<uint32_t> Ewmh::get_pid(xcb_window_t window) const
{
    uint32_t pid = 0;
    if (!xcb_ewmh_get_wm_pid_reply(&ewmh_, xcb_ewmh_get_wm_pid(&ewmh_, window), &pid, nullptr))
        return std::nullopt;
    if (pid == 0)
        return std::nullopt;
    return pid;
}

std::optional<std::string> Ewmh::get_wm_name(xcb_window_t window) const
{
    xcb_ewmh_get_utf8_strings_reply_t name;
    if (!xcb_ewmh_get_wm_name_reply(&ewmh_, xcb_ewmh_get_wm_name(&ewmh_, window), &name, nullptr))
        return std::nullopt;

    std::string result(name.strings, name.strings_len);
    xcb_ewmh_get_utf8_strings_reply_wipe(&name);
    if (result.empty())
        return std::nullopt;
    return result;
}

FrameExtents Ewmh::get_frame_extents(xcb_window_t window) const
{
    FrameExtents extents;
    xcb_ewmh_get_extents_reply_t reply;
    if (xcb_ewmh_get_frame_extents_reply(&ewmh_, xcb_ewmh_get_frame_extents(&ewmh_, window), &reply, nullptr))
    {
        extents.left = reply.left;
        extents.right = reply.right;
        extents.top = reply.top;
        extents.bottom = reply.bottom;
    }
    return extents;
}

Strut Ewmh::get_window_strut(xcb_window_t window) const
{
    Strut strut;

    // Try _NET_WM_STRUT_PARTIAL first (more detailed)
    xcb_ewmh_wm_strut_partial_t partial;
    if (xcb_ewmh_get_wm_strut_partial_reply(&ewmh_, xcb_ewmh_get_wm_strut_partial(&ewmh_, window), &partial, nullptr))
    {
        strut.left = partial.left;
        strut.right = partial.right;
        strut.top = partial.top;
        strut.bottom = partial.bottom;
        return strut;
    }

    // Fall back to _NET_WM_STRUT
    xcb_ewmh_get_extents_reply_t extents;
    if (xcb_ewmh_get_wm_strut_reply(&ewmh_, xcb_ewmh_get_wm_strut(&ewmh_, window), &extents, nullptr))
    {
        strut.left = extents.left;
        strut.right = extents.right;
        strut.top = extents.top;
        strut.bottom = extents.bottom;
    }

    return strut;
}

void Ewmh::request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height)
{
    auto flags = static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(
        XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y | XCB_EWMH_MOVERESIZE_WINDOW_WIDTH
        | XCB_EWMH_MOVERESIZE_WINDOW_HEIGHT
    );

    // Pager source indication: the WM treats this as a user request and applies it
    xcb_ewmh_request_moveresize_window(
        &ewmh_,
        0,
        window,
        XCB_GRAVITY_NORTH_WEST,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        flags,
        static_cast<uint32_t>(x),
        static_cast<uint32_t>(y),
        width,
        height
    );
}

void Ewmh::request_unmaximize(xcb_window_t window)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        0,
        window,
        XCB_EWMH_WM_STATE_REMOVE,
        ewmh_._NET_WM_STATE_MAXIMIZED_HORZ,
        ewmh_._NET_WM_STATE_MAXIMIZED_VERT,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER
    );
}

} // namespace tilekeep
