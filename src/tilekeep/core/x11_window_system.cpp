#include "x11_window_system.hpp"
#include "tilekeep/core/log.hpp"
#include "tilekeep/core/process.hpp"
#include "tilekeep/core/text.hpp"
#include "tilekeep/monitor/monitor.hpp"
#include <algorithm>
#include <cstdlib>
#include <xcb/xcb_icccm.h>

namespace tilekeep {

namespace {

constexpr uint32_t WM_STATE_ICONIC = 3;

template<typename Reply>
using ReplyPtr = std::unique_ptr<Reply, decltype(&free)>;

template<typename Reply>
ReplyPtr<Reply> wrap(Reply* reply)
{
    return ReplyPtr<Reply>(reply, free);
}

}

X11WindowSystem::X11WindowSystem()
    : conn_()
    , ewmh_(conn_)
{
    wm_state_ = conn_.intern_atom("WM_STATE");
    if (!ewmh_.wm_present())
    {
        LOG_WARN("No EWMH window manager detected; configuring windows directly");
    }
}

std::vector<Rect> X11WindowSystem::detect_outputs(std::optional<size_t>& primary)
{
    std::vector<Rect> outputs;
    primary.reset();

    if (!conn_.has_randr())
        return outputs;

    auto res_reply = wrap(xcb_randr_get_screen_resources_current_reply(
        conn_.get(),
        xcb_randr_get_screen_resources_current(conn_.get(), conn_.root()),
        nullptr
    ));
    if (!res_reply)
        return outputs;

    xcb_randr_output_t primary_output = XCB_NONE;
    if (auto primary_reply = wrap(xcb_randr_get_output_primary_reply(
            conn_.get(),
            xcb_randr_get_output_primary(conn_.get(), conn_.root()),
            nullptr
        )))
    {
        primary_output = primary_reply->output;
    }

    int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply.get());
    xcb_randr_output_t* output_ids = xcb_randr_get_screen_resources_current_outputs(res_reply.get());

    struct Detected
    {
        Rect rect;
        bool primary;
    };
    std::vector<Detected> detected;

    for (int i = 0; i < num_outputs; ++i)
    {
        auto out_reply = wrap(xcb_randr_get_output_info_reply(
            conn_.get(),
            xcb_randr_get_output_info(conn_.get(), output_ids[i], res_reply->config_timestamp),
            nullptr
        ));
        if (!out_reply)
            continue;
        if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
            continue;

        auto crtc_reply = wrap(xcb_randr_get_crtc_info_reply(
            conn_.get(),
            xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp),
            nullptr
        ));
        if (!crtc_reply || crtc_reply->width == 0 || crtc_reply->height == 0)
            continue;

        Rect rect{ crtc_reply->x, crtc_reply->y, crtc_reply->width, crtc_reply->height };

        // Cloned outputs share a CRTC; report each area once
        auto same = std::ranges::find_if(detected, [&](Detected const& d) { return d.rect == rect; });
        if (same != detected.end())
        {
            same->primary = same->primary || output_ids[i] == primary_output;
            continue;
        }
        detected.push_back({ rect, output_ids[i] == primary_output });
    }

    std::ranges::sort(
        detected,
        [](Detected const& a, Detected const& b) { return a.rect.x != b.rect.x ? a.rect.x < b.rect.x : a.rect.y < b.rect.y; }
    );

    for (size_t i = 0; i < detected.size(); ++i)
    {
        outputs.push_back(detected[i].rect);
        if (detected[i].primary)
            primary = i;
    }
    return outputs;
}

std::vector<MonitorInfo> X11WindowSystem::monitors()
{
    std::optional<size_t> primary;
    std::vector<Rect> outputs = detect_outputs(primary);

    int32_t screen_w = conn_.screen()->width_in_pixels;
    int32_t screen_h = conn_.screen()->height_in_pixels;

    if (outputs.empty())
    {
        // No RandR: the whole X screen is one display
        if (screen_w <= 0 || screen_h <= 0)
            return {};
        outputs.push_back({ 0, 0, screen_w, screen_h });
        primary = 0;
    }

    // Query struts from all dock windows and apply to the monitor containing them
    std::vector<Strut> struts(outputs.size());
    for (xcb_window_t window : root_children())
    {
        if (ewmh_.get_window_type_enum(window) != WindowType::Dock)
            continue;

        Strut strut = ewmh_.get_window_strut(window);
        if (strut.empty())
            continue;

        auto geom = wrap(xcb_get_geometry_reply(conn_.get(), xcb_get_geometry(conn_.get(), window), nullptr));
        if (!geom)
            continue;

        auto target = monitor_policy::monitor_index_at_point(outputs, geom->x, geom->y);
        if (!target)
            continue;

        Strut local = monitor_policy::strut_on_monitor(strut, outputs[*target], screen_w, screen_h);
        Strut& aggregate = struts[*target];
        aggregate.left = std::max(aggregate.left, local.left);
        aggregate.right = std::max(aggregate.right, local.right);
        aggregate.top = std::max(aggregate.top, local.top);
        aggregate.bottom = std::max(aggregate.bottom, local.bottom);
    }

    std::vector<MonitorInfo> result;
    result.reserve(outputs.size());
    for (size_t i = 0; i < outputs.size(); ++i)
    {
        MonitorInfo info;
        info.index = i;
        info.is_primary = primary && *primary == i;
        info.name = "monitor-" + std::to_string(i);
        info.work_area = monitor_policy::working_area(outputs[i], struts[i]);
        result.push_back(std::move(info));
    }
    return result;
}

std::vector<xcb_window_t> X11WindowSystem::root_children()
{
    auto tree = wrap(xcb_query_tree_reply(conn_.get(), xcb_query_tree(conn_.get(), conn_.root()), nullptr));
    if (!tree)
        return {};

    xcb_window_t* children = xcb_query_tree_children(tree.get());
    int count = xcb_query_tree_children_length(tree.get());
    return std::vector<xcb_window_t>(children, children + count);
}

std::vector<WindowId> X11WindowSystem::top_level_windows()
{
    if (ewmh_.wm_present())
    {
        if (auto clients = ewmh_.client_list())
            return *clients;
        LOG_DEBUG("_NET_CLIENT_LIST unavailable, falling back to root children");
    }
    return root_children();
}

bool X11WindowSystem::is_visible(WindowId window)
{
    auto attrs = wrap(xcb_get_window_attributes_reply(
        conn_.get(),
        xcb_get_window_attributes(conn_.get(), window),
        nullptr
    ));
    if (!attrs)
        return false;

    if (attrs->map_state == XCB_MAP_STATE_VIEWABLE)
        return true;

    // Iconified windows are unmapped but still belong to the session
    return is_minimized(window);
}

bool X11WindowSystem::is_tool_window(WindowId window)
{
    auto attrs = wrap(xcb_get_window_attributes_reply(
        conn_.get(),
        xcb_get_window_attributes(conn_.get(), window),
        nullptr
    ));
    if (attrs && attrs->override_redirect)
        return true;

    if (is_tool_window_type(ewmh_.get_window_type_enum(window)))
        return true;

    return ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_SKIP_TASKBAR);
}

std::optional<Rect> X11WindowSystem::frame_rect(WindowId window)
{
    auto geom = wrap(xcb_get_geometry_reply(conn_.get(), xcb_get_geometry(conn_.get(), window), nullptr));
    if (!geom)
        return std::nullopt;

    auto origin = wrap(xcb_translate_coordinates_reply(
        conn_.get(),
        xcb_translate_coordinates(conn_.get(), window, conn_.root(), 0, 0),
        nullptr
    ));
    if (!origin)
        return std::nullopt;

    FrameExtents extents = ewmh_.get_frame_extents(window);
    return Rect{
        origin->dst_x - static_cast<int32_t>(extents.left),
        origin->dst_y - static_cast<int32_t>(extents.top),
        geom->width + static_cast<int32_t>(extents.left + extents.right),
        geom->height + static_cast<int32_t>(extents.top + extents.bottom),
    };
}

std::optional<std::string> X11WindowSystem::process_name(WindowId window)
{
    auto pid = ewmh_.get_pid(window);
    if (!pid)
        return std::nullopt;
    return process::name_for_pid(*pid);
}

std::optional<WindowClass> X11WindowSystem::window_class(WindowId window)
{
    xcb_icccm_get_wm_class_reply_t wm_class;
    if (!xcb_icccm_get_wm_class_reply(conn_.get(), xcb_icccm_get_wm_class(conn_.get(), window), &wm_class, nullptr))
        return std::nullopt;

    WindowClass result;
    result.instance_name = wm_class.instance_name ? wm_class.instance_name : "";
    result.class_name = wm_class.class_name ? wm_class.class_name : "";
    xcb_icccm_get_wm_class_reply_wipe(&wm_class);
    return result;
}

std::string X11WindowSystem::title(WindowId window)
{
    if (auto name = ewmh_.get_wm_name(window))
        return text::sanitize_utf8(*name);

    xcb_icccm_get_text_property_reply_t prop;
    if (!xcb_icccm_get_wm_name_reply(conn_.get(), xcb_icccm_get_wm_name(conn_.get(), window), &prop, nullptr))
        return {};

    std::string_view raw(prop.name, prop.name_len);
    // STRING is Latin-1; UTF8_STRING and the ASCII part of COMPOUND_TEXT pass through
    std::string name = prop.encoding == XCB_ATOM_STRING ? text::latin1_to_utf8(raw) : text::sanitize_utf8(raw);
    xcb_icccm_get_text_property_reply_wipe(&prop);
    return name;
}

bool X11WindowSystem::has_iconic_wm_state(xcb_window_t window)
{
    if (wm_state_ == XCB_NONE)
        return false;

    auto reply = wrap(xcb_get_property_reply(
        conn_.get(),
        xcb_get_property(conn_.get(), 0, window, wm_state_, wm_state_, 0, 2),
        nullptr
    ));
    if (!reply || xcb_get_property_value_length(reply.get()) < 4)
        return false;

    uint32_t state = *static_cast<uint32_t*>(xcb_get_property_value(reply.get()));
    return state == WM_STATE_ICONIC;
}

bool X11WindowSystem::is_minimized(WindowId window)
{
    if (ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_HIDDEN))
        return true;
    return has_iconic_wm_state(window);
}

std::optional<WindowId> X11WindowSystem::active_window()
{
    return ewmh_.active_window();
}

MoveResult X11WindowSystem::move_resize(WindowId window, Rect const& target)
{
    auto geom = wrap(xcb_get_geometry_reply(conn_.get(), xcb_get_geometry(conn_.get(), window), nullptr));
    if (!geom)
        return MoveResult::failure("window no longer exists");

    if (target.width <= 0 || target.height <= 0)
        return MoveResult::failure("slot has no area");

    if (ewmh_.wm_present())
    {
        if (ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_MAXIMIZED_HORZ)
            || ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_MAXIMIZED_VERT))
        {
            ewmh_.request_unmaximize(window);
        }

        // The slot covers the whole frame; the request carries the client size
        FrameExtents extents = ewmh_.get_frame_extents(window);
        int32_t width = std::max<int32_t>(1, target.width - static_cast<int32_t>(extents.left + extents.right));
        int32_t height = std::max<int32_t>(1, target.height - static_cast<int32_t>(extents.top + extents.bottom));

        ewmh_.request_moveresize(
            window,
            target.x,
            target.y,
            static_cast<uint32_t>(width),
            static_cast<uint32_t>(height)
        );
        conn_.flush();
        return MoveResult::success();
    }

    uint32_t values[] = {
        static_cast<uint32_t>(target.x),
        static_cast<uint32_t>(target.y),
        static_cast<uint32_t>(target.width),
        static_cast<uint32_t>(target.height),
    };
    auto cookie = xcb_configure_window_checked(
        conn_.get(),
        window,
        XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT,
        values
    );
    if (auto error = wrap(xcb_request_check(conn_.get(), cookie)))
    {
        return MoveResult::failure("X error " + std::to_string(error->error_code));
    }
    return MoveResult::success();
}

} // namespace tilekeep
