#pragma once

#include "tilekeep/core/types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace tilekeep {

/// Focus history of one application, accumulated across sessions.
struct AppRecord
{
    double total_focus_secs = 0.0;
    uint64_t total_switches = 0;
    double last_focus_ts = 0.0; // Unix seconds
    std::string category;       // AppCategory display name
    std::string last_title;
};

/// Persisted activity store, keyed by lowercase process name.
struct ActivityDb
{
    std::unordered_map<std::string, AppRecord> apps;
    double last_decay_ts = 0.0;
};

/// Focus activity since this process started (never persisted).
struct SessionActivity
{
    double focus_secs = 0.0;
    uint32_t switch_count = 0;
    double last_focus = 0.0;
    AppCategory category = AppCategory::Other;
};

namespace activity_policy {

constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double SECONDS_PER_HOUR = 3600.0;

// Elapsed time below this (in days) does not trigger a decay
constexpr double MIN_DECAY_DAYS = 0.001;

// Recency assumed for an application that was never focused
constexpr double NEVER_FOCUSED_HOURS = 999.0;

/**
 * @brief Exponentially decay all records towards zero.
 *
 * factor = 0.5^(elapsed_days / half_life_days), applied to focus seconds and
 * (truncated) to switch counts. Records left with under one second of focus
 * and no switches are removed.
 *
 * The very first call only stamps last_decay_ts. Calls less than
 * MIN_DECAY_DAYS after the previous one leave the records untouched.
 */
void apply_decay(ActivityDb& db, double now, double half_life_days);

/**
 * @brief Composite usage score.
 *
 * ln(max(focus, 1)) * 10 + sqrt(switches) * 5 + 0.5^(hours_since_last / 4) * 50
 *
 * last_focus_ts <= 0 means the application was never focused.
 */
double usage_score(double focus_secs, uint64_t switches, double last_focus_ts, double now);

} // namespace activity_policy

/// Current wall-clock time as Unix seconds.
double now_ts();

/// $XDG_DATA_HOME/tilekeep/activity.toml, or ~/.local/share/tilekeep/activity.toml.
std::optional<std::filesystem::path> activity_path();

/**
 * @brief Read the activity store.
 *
 * A missing file yields an empty database. Read or parse failures are logged
 * and also yield an empty database. Missing record fields take their defaults.
 */
ActivityDb load_activity_db(std::filesystem::path const& path);

std::string serialize_activity_db(ActivityDb const& db);

/**
 * @brief Write the activity store through a temporary file and rename.
 *
 * @return false if the store could not be written (already logged)
 */
bool save_activity_db(ActivityDb const& db, std::filesystem::path const& path);

} // namespace tilekeep
