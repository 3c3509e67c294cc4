#include "arrange.hpp"
#include "tilekeep/activity/tracker.hpp"
#include "tilekeep/core/log.hpp"
#include "tilekeep/monitor/monitor.hpp"
#include "tilekeep/windows/category.hpp"
#include <algorithm>
#include <numeric>

namespace tilekeep {

bool PinRule::matches(std::string_view process_name, std::string_view window_title) const
{
    if (!process && !title)
        return false;

    if (process && to_lower(*process) != to_lower(process_name))
        return false;

    if (title && to_lower(window_title).find(to_lower(*title)) == std::string::npos)
        return false;

    return true;
}

namespace arrange_policy {

std::vector<Slot> enabled_slots(std::vector<Slot> const& all, std::span<size_t const> disabled)
{
    std::vector<Slot> result;
    result.reserve(all.size());
    for (size_t i = 0; i < all.size(); ++i)
    {
        if (std::ranges::find(disabled, i) == disabled.end())
            result.push_back(all[i]);
    }
    return result;
}

std::optional<size_t> pinned_slot(ManagedWindow const& window, std::span<PinRule const> rules, size_t slot_count)
{
    for (auto const& rule : rules)
    {
        if (rule.matches(window.process_name, window.title) && rule.slot < slot_count)
            return rule.slot;
    }
    return std::nullopt;
}

namespace {

// Window indices, highest score first. Equal scores keep discovery order.
std::vector<size_t> order_by_score(std::vector<size_t> indices, std::span<double const> scores)
{
    if (scores.empty())
        return indices;

    std::ranges::stable_sort(indices, [&](size_t a, size_t b) { return scores[a] > scores[b]; });
    return indices;
}

}

AssignmentPlan plan_assignment(
    std::span<ManagedWindow const> windows,
    size_t slot_count,
    bool smart_sort,
    std::span<PinRule const> pin_rules,
    std::span<double const> scores
)
{
    if (!scores.empty() && scores.size() != windows.size())
        scores = {};

    AssignmentPlan plan;

    if (smart_sort && !pin_rules.empty())
    {
        std::vector<std::optional<size_t>> owner(slot_count);
        std::vector<size_t> unpinned;

        for (size_t i = 0; i < windows.size(); ++i)
        {
            auto slot = pinned_slot(windows[i], pin_rules, slot_count);
            if (slot && !owner[*slot])
            {
                owner[*slot] = i;
                LOG_DEBUG("Pinned '{}' to slot {}", windows[i].title, *slot);
            }
            else
            {
                unpinned.push_back(i);
            }
        }

        unpinned = order_by_score(std::move(unpinned), scores);

        auto next = unpinned.begin();
        for (size_t s = 0; s < slot_count; ++s)
        {
            if (!owner[s] && next != unpinned.end())
                owner[s] = *next++;
            if (owner[s])
                plan.assignments.push_back({ *owner[s], s });
        }
        plan.skipped = static_cast<size_t>(unpinned.end() - next);
        return plan;
    }

    std::vector<size_t> order(windows.size());
    std::iota(order.begin(), order.end(), size_t{ 0 });
    if (smart_sort)
        order = order_by_score(std::move(order), scores);

    size_t count = std::min(order.size(), slot_count);
    for (size_t s = 0; s < count; ++s)
        plan.assignments.push_back({ order[s], s });
    plan.skipped = order.size() - count;
    return plan;
}

} // namespace arrange_policy

ArrangeResult arrange(WindowSystem& ws, ArrangeRequest const& request)
{
    ArrangeResult result;

    auto monitors = enumerate_monitors(ws);
    auto monitor = resolve_monitor(monitors, request.monitor);
    if (!monitor)
    {
        LOG_WARN("Arrangement aborted: no monitors detected");
        result.errors.push_back("No monitors detected");
        return result;
    }

    std::vector<Slot> all_slots;
    if (request.weights && request.preset.kind == LayoutPreset::Kind::Grid)
    {
        all_slots = layout_policy::compute_weighted_grid(
            request.preset.cols,
            request.preset.rows,
            monitor->work_area,
            request.gap,
            request.weights->cols,
            request.weights->rows
        );
    }
    else
    {
        all_slots = request.preset.compute_slots(monitor->work_area, request.gap);
    }
    std::vector<Slot> slots = arrange_policy::enabled_slots(all_slots, request.disabled_slots);

    LOG_DEBUG(
        "Layout {} on {}: {} slots ({} enabled)",
        request.preset.display_name(),
        monitor->name,
        all_slots.size(),
        slots.size()
    );

    std::vector<ManagedWindow> windows = discover(ws, request.filter, request.self, request.extra_exclusions);

    std::vector<double> scores;
    if (request.smart_sort && request.tracker)
        scores = request.tracker->score_windows(windows);

    auto plan = arrange_policy::plan_assignment(windows, slots.size(), request.smart_sort, request.pin_rules, scores);

    for (auto const& [window_index, slot_index] : plan.assignments)
    {
        ManagedWindow const& win = windows[window_index];
        Slot const& slot = slots[slot_index];

        MoveResult moved = ws.move_resize(win.id, slot);
        if (moved.ok)
        {
            ++result.arranged;
            LOG_TRACE(
                "Placed {:#x} '{}' at {},{} {}x{}",
                win.id,
                win.title,
                slot.x,
                slot.y,
                slot.width,
                slot.height
            );
        }
        else
        {
            result.errors.push_back("Failed to position '" + win.title + "': " + moved.error);
        }
    }
    result.skipped = plan.skipped;

    LOG_INFO(
        "Arranged {} of {} windows into {} ({} skipped, {} errors)",
        result.arranged,
        windows.size(),
        request.preset.display_name(),
        result.skipped,
        result.errors.size()
    );
    return result;
}

} // namespace tilekeep
