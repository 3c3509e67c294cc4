#pragma once

#include "tilekeep/core/types.hpp"
#include "tilekeep/core/window_system.hpp"
#include "tilekeep/layout/layout.hpp"
#include "tilekeep/windows/discovery.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tilekeep {

class ActivityTracker;

/**
 * @brief Forces matching windows into one slot.
 *
 * Criteria are ANDed; a rule without any criterion matches nothing.
 */
struct PinRule
{
    std::optional<std::string> process; // case-insensitive equality
    std::optional<std::string> title;   // case-insensitive substring
    size_t slot = 0;                    // index into the enabled slots

    bool matches(std::string_view process_name, std::string_view window_title) const;
};

struct GridWeights
{
    std::vector<float> cols;
    std::vector<float> rows;
};

struct ArrangeRequest
{
    LayoutPreset preset = LayoutPreset::grid(2, 2);
    TargetFilter filter = TargetFilter::universal();
    std::string monitor = "primary";
    int32_t gap = 4;
    std::vector<size_t> disabled_slots;
    std::optional<GridWeights> weights; // Grid presets only
    WindowId self = NO_WINDOW;
    std::vector<std::string> extra_exclusions; // lowercase process names
    bool smart_sort = false;
    ActivityTracker const* tracker = nullptr;
    std::vector<PinRule> pin_rules;
};

struct ArrangeResult
{
    size_t arranged = 0;
    size_t skipped = 0;
    std::vector<std::string> errors;
};

struct SlotAssignment
{
    size_t window; // index into the discovered windows
    size_t slot;   // index into the enabled slots
};

struct AssignmentPlan
{
    std::vector<SlotAssignment> assignments; // ordered by slot
    size_t skipped = 0;
};

namespace arrange_policy {

/// Drop the disabled indices, keeping the order of the rest.
std::vector<Slot> enabled_slots(std::vector<Slot> const& all, std::span<size_t const> disabled);

/// Index of the slot the first matching rule targets, if that slot exists.
std::optional<size_t> pinned_slot(ManagedWindow const& window, std::span<PinRule const> rules, size_t slot_count);

/**
 * @brief Decide which window goes into which slot.
 *
 * With smart sort and pin rules, pinned windows take their exact slots and
 * the remaining windows fill the free slots in order. A second window pinned
 * to an already-claimed slot joins the unpinned windows. With smart sort
 * alone, windows are ordered by score before being assigned densely.
 * Otherwise discovery order is kept.
 *
 * @param scores One score per window, or empty to keep discovery order
 */
AssignmentPlan plan_assignment(
    std::span<ManagedWindow const> windows,
    size_t slot_count,
    bool smart_sort,
    std::span<PinRule const> pin_rules,
    std::span<double const> scores
);

} // namespace arrange_policy

/**
 * @brief Run one arrangement pass.
 *
 * Resolves the monitor, computes the enabled slots, discovers windows and
 * moves each assigned window into its slot. Positioning failures are
 * collected per window and never stop the pass.
 */
ArrangeResult arrange(WindowSystem& ws, ArrangeRequest const& request);

} // namespace tilekeep
