#include "tracker.hpp"
#include "tilekeep/core/log.hpp"
#include "tilekeep/core/text.hpp"
#include "tilekeep/windows/category.hpp"
#include <algorithm>
#include <functional>

namespace tilekeep {

ActivityTracker::ActivityTracker(TrackerOptions options, std::unique_ptr<WindowSystem> sampler_ws)
    : options_(std::move(options))
    , last_save_(std::chrono::steady_clock::now())
    , last_decay_(std::chrono::steady_clock::now())
{
    if (options_.store_path)
        db_ = load_activity_db(*options_.store_path);

    if (sampler_ws)
    {
        sampler_ = std::thread(run_sampler, std::move(sampler_ws), std::ref(channel_));
        LOG_DEBUG("Focus sampler started");
    }
}

ActivityTracker::~ActivityTracker()
{
    channel_.close();
    if (sampler_.joinable())
        sampler_.join();

    flush_current_focus();
    save();
}

void ActivityTracker::update(std::chrono::steady_clock::time_point now)
{
    while (auto event = channel_.try_receive())
    {
        handle_event(*event);
    }

    if (now - last_save_ >= SAVE_INTERVAL)
    {
        flush_current_focus();
        save();
        last_save_ = now;
    }

    if (now - last_decay_ >= DECAY_INTERVAL)
    {
        apply_decay();
        last_decay_ = now;
    }
}

void ActivityTracker::credit(std::string const& app_id, double elapsed)
{
    if (auto it = session_.find(app_id); it != session_.end())
        it->second.focus_secs += elapsed;
    if (auto it = db_.apps.find(app_id); it != db_.apps.end())
        it->second.total_focus_secs += elapsed;
}

void ActivityTracker::handle_event(FocusEvent const& event)
{
    std::string app_id = to_lower(text::sanitize_utf8(event.process_name));

    std::lock_guard lock(mutex_);

    // Close the previous interval
    if (current_focus_)
    {
        auto const& [prev_id, start] = *current_focus_;
        credit(prev_id, std::max(event.timestamp - start, 0.0));
    }

    auto [session_it, first_seen] = session_.try_emplace(app_id);
    SessionActivity& session = session_it->second;
    if (first_seen)
        session.category = categorize(event.process_name);
    session.switch_count += 1;
    session.last_focus = event.timestamp;

    AppRecord& record = db_.apps[app_id];
    record.total_switches += 1;
    record.last_focus_ts = event.timestamp;
    record.last_title = text::sanitize_utf8(event.title);
    record.category = category_display_name(session.category);

    current_focus_ = std::make_pair(app_id, event.timestamp);

    LOG_DEBUG("Focus -> {} ({} switches this session)", app_id, session.switch_count);
}

void ActivityTracker::flush_current_focus(double now)
{
    std::lock_guard lock(mutex_);
    if (!current_focus_)
        return;

    auto& [app_id, start] = *current_focus_;
    credit(app_id, std::max(now - start, 0.0));
    start = now;
}

void ActivityTracker::apply_decay(double now)
{
    std::lock_guard lock(mutex_);
    activity_policy::apply_decay(db_, now, options_.decay_half_life_days);
}

void ActivityTracker::save() const
{
    if (options_.read_only || !options_.store_path)
        return;

    // Serialize from a copy so file I/O happens outside the lock
    ActivityDb copy = snapshot();
    save_activity_db(copy, *options_.store_path);
}

std::vector<double> ActivityTracker::score_windows(std::span<ManagedWindow const> windows, double now) const
{
    std::lock_guard lock(mutex_);

    std::vector<double> scores;
    scores.reserve(windows.size());
    for (auto const& win : windows)
    {
        std::string app_id = to_lower(text::sanitize_utf8(win.process_name));

        double focus = 0.0;
        uint64_t switches = 0;
        double last_focus = 0.0;

        if (auto it = session_.find(app_id); it != session_.end())
        {
            focus += it->second.focus_secs;
            switches += it->second.switch_count;
        }
        if (auto it = db_.apps.find(app_id); it != db_.apps.end())
        {
            focus += it->second.total_focus_secs;
            switches += it->second.total_switches;
            last_focus = it->second.last_focus_ts;
        }

        scores.push_back(activity_policy::usage_score(focus, switches, last_focus, now));
    }
    return scores;
}

std::vector<std::pair<std::string, double>> ActivityTracker::top_apps(size_t n) const
{
    double now = now_ts();
    std::vector<std::pair<std::string, double>> scored;
    {
        std::lock_guard lock(mutex_);
        scored.reserve(db_.apps.size());
        for (auto const& [id, record] : db_.apps)
        {
            scored.emplace_back(
                id,
                activity_policy::usage_score(record.total_focus_secs, record.total_switches, record.last_focus_ts, now)
            );
        }
    }

    std::ranges::sort(scored, [](auto const& a, auto const& b) { return a.second > b.second; });
    if (scored.size() > n)
        scored.resize(n);
    return scored;
}

std::vector<std::pair<std::string, SessionActivity>> ActivityTracker::session_stats() const
{
    std::vector<std::pair<std::string, SessionActivity>> stats;
    {
        std::lock_guard lock(mutex_);
        stats.assign(session_.begin(), session_.end());
    }
    std::ranges::sort(stats, [](auto const& a, auto const& b) { return a.second.focus_secs > b.second.focus_secs; });
    return stats;
}

ActivityDb ActivityTracker::snapshot() const
{
    std::lock_guard lock(mutex_);
    return db_;
}

void ActivityTracker::run_sampler(std::unique_ptr<WindowSystem> ws, FocusChannel& channel)
{
    std::optional<WindowId> last_window;

    while (!channel.wait_closed_for(SAMPLE_INTERVAL))
    {
        auto active = ws->active_window();
        if (!active || active == last_window)
            continue;
        last_window = active;

        auto process = ws->process_name(*active);
        if (!process)
            continue;

        FocusEvent event{ *process, ws->title(*active), now_ts() };
        if (!channel.send(std::move(event)))
            break;
    }

    LOG_DEBUG("Focus sampler stopped");
}

} // namespace tilekeep
