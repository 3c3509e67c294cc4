#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <xcb/xcb.h>

namespace tilekeep {

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
// ─────────────────────────────────────────────────────────────────────────────

/// Opaque reference to a top-level OS window.
using WindowId = xcb_window_t;

constexpr WindowId NO_WINDOW = XCB_NONE;

/// Axis-aligned rectangle in root-window (screen) coordinates.
struct Rect
{
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    bool operator==(Rect const&) const = default;

    bool contains(int32_t px, int32_t py) const
    {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

/// A rectangular placement target. Index in its slot list is the placement priority.
using Slot = Rect;

struct Strut
{
    uint32_t left = 0;
    uint32_t right = 0;
    uint32_t top = 0;
    uint32_t bottom = 0;

    bool empty() const { return left == 0 && right == 0 && top == 0 && bottom == 0; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Monitors
// ─────────────────────────────────────────────────────────────────────────────

struct MonitorInfo
{
    size_t index = 0;
    bool is_primary = false;
    std::string name;
    Rect work_area;
};

// ─────────────────────────────────────────────────────────────────────────────
// Windows
// ─────────────────────────────────────────────────────────────────────────────

enum class AppCategory
{
    Terminal,
    Browser,
    Editor,
    Chat,
    Media,
    Game,
    DevTool,
    System,
    Other
};

/**
 * @brief A window eligible for arrangement.
 *
 * Rebuilt on every discovery pass and never persisted. The id is only
 * meaningful for the display connection that produced it.
 */
struct ManagedWindow
{
    WindowId id = NO_WINDOW;
    std::string title;
    std::string process_name;
    AppCategory category = AppCategory::Other;
    Rect rect;
    bool is_minimized = false;
};

/// ICCCM WM_CLASS pair.
struct WindowClass
{
    std::string instance_name;
    std::string class_name;
};

} // namespace tilekeep
