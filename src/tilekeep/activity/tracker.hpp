#pragma once

#include "tilekeep/activity/activity_db.hpp"
#include "tilekeep/activity/focus_channel.hpp"
#include "tilekeep/core/types.hpp"
#include "tilekeep/core/window_system.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tilekeep {

struct TrackerOptions
{
    /// Activity store location; nullopt keeps everything in memory.
    std::optional<std::filesystem::path> store_path;
    double decay_half_life_days = 7.0;
    /// Load the store but never write it back.
    bool read_only = false;
};

/**
 * @brief Accumulates per-application focus time and switch counts.
 *
 * A sampler thread polls the active window once per second and pushes an
 * event through channel() whenever it changes. update() drains those events
 * on the caller's thread and runs the periodic save and decay.
 *
 * Session and persisted state are guarded by one mutex, so scoring may be
 * called from any thread.
 */
class ActivityTracker
{
public:
    static constexpr std::chrono::seconds SAVE_INTERVAL{ 60 };
    static constexpr std::chrono::seconds DECAY_INTERVAL{ 3600 };
    static constexpr std::chrono::milliseconds SAMPLE_INTERVAL{ 1000 };

    /**
     * @param options Store location and decay settings
     * @param sampler_ws Window system for the sampler thread; nullptr starts
     *                   no sampler and events must be sent through channel()
     */
    explicit ActivityTracker(TrackerOptions options, std::unique_ptr<WindowSystem> sampler_ws = nullptr);

    /// Stops the sampler, then flushes the open interval and saves.
    ~ActivityTracker();

    ActivityTracker(ActivityTracker const&) = delete;
    ActivityTracker& operator=(ActivityTracker const&) = delete;

    FocusChannel& channel() { return channel_; }

    /// Drain pending focus events, then save and decay when due.
    void update() { update(std::chrono::steady_clock::now()); }

    /// @param now Monotonic time compared against SAVE_INTERVAL and DECAY_INTERVAL
    void update(std::chrono::steady_clock::time_point now);

    /// Credit the open focus interval up to now without closing it.
    void flush_current_focus(double now);
    void flush_current_focus() { flush_current_focus(now_ts()); }

    void apply_decay(double now);
    void apply_decay() { apply_decay(now_ts()); }

    /// Write the store unless read-only or in-memory. Errors are logged.
    void save() const;

    /// One score per window, in input order.
    std::vector<double> score_windows(std::span<ManagedWindow const> windows, double now) const;
    std::vector<double> score_windows(std::span<ManagedWindow const> windows) const
    {
        return score_windows(windows, now_ts());
    }

    /// Persisted apps ranked by score, best first.
    std::vector<std::pair<std::string, double>> top_apps(size_t n) const;

    /// Session apps ordered by focus time, longest first.
    std::vector<std::pair<std::string, SessionActivity>> session_stats() const;

    ActivityDb snapshot() const;

private:
    TrackerOptions options_;
    FocusChannel channel_;

    mutable std::mutex mutex_;
    ActivityDb db_;
    std::unordered_map<std::string, SessionActivity> session_;
    std::optional<std::pair<std::string, double>> current_focus_; // app id, interval start

    std::chrono::steady_clock::time_point last_save_;
    std::chrono::steady_clock::time_point last_decay_;

    std::thread sampler_;

    void handle_event(FocusEvent const& event);
    void credit(std::string const& app_id, double elapsed);

    static void run_sampler(std::unique_ptr<WindowSystem> ws, FocusChannel& channel);
};

} // namespace tilekeep
