#include "activity_db.hpp"
#include "tilekeep/core/log.hpp"
#include "tilekeep/core/paths.hpp"
#include "tilekeep/core/text.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>
#include <toml++/toml.hpp>

namespace tilekeep {

namespace activity_policy {

void apply_decay(ActivityDb& db, double now, double half_life_days)
{
    double last = db.last_decay_ts;
    db.last_decay_ts = now;

    if (last <= 0.0 || half_life_days <= 0.0)
        return;

    double elapsed_days = (now - last) / SECONDS_PER_DAY;
    if (elapsed_days <= MIN_DECAY_DAYS)
        return;

    double factor = std::pow(0.5, elapsed_days / half_life_days);
    for (auto& [name, record] : db.apps)
    {
        record.total_focus_secs *= factor;
        record.total_switches = static_cast<uint64_t>(static_cast<double>(record.total_switches) * factor);
    }

    size_t pruned = std::erase_if(
        db.apps,
        [](auto const& entry) { return entry.second.total_focus_secs < 1.0 && entry.second.total_switches == 0; }
    );
    LOG_DEBUG("Decayed activity by {:.4f} over {:.2f} days, pruned {} apps", factor, elapsed_days, pruned);
}

double usage_score(double focus_secs, uint64_t switches, double last_focus_ts, double now)
{
    double focus_score = std::max(std::log(std::max(focus_secs, 1.0)), 0.0) * 10.0;
    double switch_score = std::sqrt(static_cast<double>(switches)) * 5.0;
    double recency_hours = last_focus_ts > 0.0 ? (now - last_focus_ts) / SECONDS_PER_HOUR : NEVER_FOCUSED_HOURS;
    double recency_score = std::pow(0.5, recency_hours / 4.0) * 50.0;
    return focus_score + switch_score + recency_score;
}

} // namespace activity_policy

double now_ts()
{
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<std::filesystem::path> activity_path()
{
    auto base = paths::data_home();
    if (!base)
        return std::nullopt;
    return *base / "tilekeep" / "activity.toml";
}

ActivityDb load_activity_db(std::filesystem::path const& path)
{
    ActivityDb db;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return db;

    try
    {
        auto tbl = toml::parse_file(path.string());

        if (auto v = tbl["last_decay_ts"].value<double>())
            db.last_decay_ts = *v;

        if (auto apps = tbl["apps"].as_table())
        {
            for (auto const& [key, node] : *apps)
            {
                auto rec = node.as_table();
                if (!rec)
                {
                    LOG_DEBUG("Ignoring non-table activity record '{}'", key.str());
                    continue;
                }

                AppRecord record;
                if (auto v = (*rec)["total_focus_secs"].value<double>())
                    record.total_focus_secs = std::max(*v, 0.0);
                if (auto v = (*rec)["total_switches"].value<int64_t>())
                    record.total_switches = static_cast<uint64_t>(std::max<int64_t>(*v, 0));
                if (auto v = (*rec)["last_focus_ts"].value<double>())
                    record.last_focus_ts = *v;
                if (auto v = (*rec)["category"].value<std::string>())
                    record.category = *v;
                if (auto v = (*rec)["last_title"].value<std::string>())
                    record.last_title = *v;

                db.apps.emplace(std::string(key.str()), std::move(record));
            }
        }

        LOG_INFO("Loaded activity for {} apps from {}", db.apps.size(), path.string());
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("Failed to parse activity store {}: {}", path.string(), err.description());
        return {};
    }

    return db;
}

std::string serialize_activity_db(ActivityDb const& db)
{
    // TOML text must be UTF-8; window titles and process names are not guaranteed to be
    toml::table apps;
    for (auto const& [name, record] : db.apps)
    {
        apps.insert(
            text::sanitize_utf8(name),
            toml::table{
                { "total_focus_secs", record.total_focus_secs },
                { "total_switches", static_cast<int64_t>(record.total_switches) },
                { "last_focus_ts", record.last_focus_ts },
                { "category", text::sanitize_utf8(record.category) },
                { "last_title", text::sanitize_utf8(record.last_title) },
            }
        );
    }

    toml::table root{ { "last_decay_ts", db.last_decay_ts } };
    root.insert("apps", std::move(apps));

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

bool save_activity_db(ActivityDb const& db, std::filesystem::path const& path)
{
    std::string content = serialize_activity_db(db);

    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            LOG_WARN("Failed to create {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            LOG_WARN("Failed to open {} for writing", tmp.string());
            return false;
        }
        out << content;
        out.flush();
        if (!out)
        {
            LOG_WARN("Failed to write {}", tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        LOG_WARN("Failed to save activity to {}: {}", path.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }

    LOG_DEBUG("Saved activity for {} apps to {}", db.apps.size(), path.string());
    return true;
}

} // namespace tilekeep
