#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <tilekeep/activity/tracker.hpp>
#include <tilekeep/arrange/arrange.hpp>
#include <tilekeep/config/config.hpp>
#include <tilekeep/core/log.hpp>
#include <tilekeep/core/x11_window_system.hpp>
#include <tilekeep/monitor/monitor.hpp>
#include <tilekeep/windows/category.hpp>
#include <tilekeep/windows/discovery.hpp>
#include <vector>

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

void usage(char const* prog)
{
    std::cerr << "Usage: " << prog << " [--config PATH] [--verbose] <command>\n"
              << "Commands:\n"
              << "  arrange [layout]   Arrange windows (layout string or name; default: custom grid)\n"
              << "  list               List the windows that would be arranged\n"
              << "  track              Record focus activity until interrupted\n"
              << "  stats [N]          Show the N most used apps (default 10)\n"
              << "  presets            Show built-in and configured layouts\n";
}

tilekeep::Config load_config_or_defaults(std::string const& override_path)
{
    fs::path path;
    if (!override_path.empty())
        path = override_path;
    else if (auto found = tilekeep::config_path())
        path = *found;

    if (!path.empty() && fs::exists(path))
    {
        LOG_INFO("Loading config from: {}", path.string());
        if (auto loaded = tilekeep::load_config(path))
            return *loaded;
        LOG_WARN("Failed to load config, using defaults");
    }
    else
    {
        LOG_DEBUG("No config file found, using defaults");
    }
    return tilekeep::default_config();
}

std::string join(std::vector<std::string> const& args)
{
    std::string result;
    for (auto const& arg : args)
    {
        if (!result.empty())
            result += ' ';
        result += arg;
    }
    return result;
}

tilekeep::TrackerOptions tracker_options(tilekeep::Config const& config, bool read_only)
{
    tilekeep::TrackerOptions options;
    options.store_path = tilekeep::activity_path();
    options.decay_half_life_days = config.defaults.decay_half_life_days;
    options.read_only = read_only;
    if (!options.store_path)
        LOG_WARN("Cannot locate the activity store (HOME unset), activity is not persisted");
    return options;
}

int run_arrange(tilekeep::Config const& config, std::vector<std::string> const& args)
{
    std::optional<tilekeep::NamedLayout> layout;
    std::string requested = join(args);

    if (requested.empty())
    {
        layout = tilekeep::default_layout(config);
        if (!layout)
        {
            std::cerr << "No layout given and [defaults] use_custom is off\n";
            return 1;
        }
    }
    else if (auto preset = tilekeep::LayoutPreset::parse(requested))
    {
        layout = tilekeep::NamedLayout{ preset->display_name(), *preset, std::nullopt, {} };
    }
    else
    {
        layout = tilekeep::find_named_layout(config, requested);
    }

    if (!layout)
    {
        std::cerr << "Unknown layout: '" << requested << "'\n"
                  << "Examples: 2x3, columns:4, rows:3, left-right, top-bottom, main-side, focus:3\n";
        return 1;
    }

    tilekeep::X11WindowSystem ws;

    tilekeep::ArrangeRequest request;
    request.preset = layout->preset;
    request.filter = tilekeep::TargetFilter::from_string(config.defaults.target);
    request.monitor = config.defaults.monitor;
    request.gap = config.defaults.gap;
    request.disabled_slots = layout->disabled_cells;
    request.weights = layout->weights;
    request.extra_exclusions = config.categories.excluded_lower();
    request.smart_sort = config.defaults.smart_sort;
    request.pin_rules = config.pins;

    std::unique_ptr<tilekeep::ActivityTracker> tracker;
    if (request.smart_sort)
    {
        tracker = std::make_unique<tilekeep::ActivityTracker>(tracker_options(config, true));
        request.tracker = tracker.get();
    }

    auto result = tilekeep::arrange(ws, request);

    std::cout << "Arranged " << result.arranged << " windows into " << layout->preset.display_name() << " layout ("
              << layout->preset.slot_count() << " slots)\n";
    if (result.skipped > 0)
        std::cout << "Skipped " << result.skipped << " windows (not enough slots)\n";
    for (auto const& err : result.errors)
        std::cerr << "Error: " << err << "\n";

    return 0;
}

int run_list(tilekeep::Config const& config)
{
    tilekeep::X11WindowSystem ws;

    auto monitors = tilekeep::enumerate_monitors(ws);
    for (auto const& m : monitors)
    {
        std::cout << "Monitor " << m.index << (m.is_primary ? " (primary)" : "") << ": " << m.name << " "
                  << m.work_area.width << "x" << m.work_area.height << "+" << m.work_area.x << "+" << m.work_area.y
                  << "\n";
    }

    auto filter = tilekeep::TargetFilter::from_string(config.defaults.target);
    auto excluded = config.categories.excluded_lower();
    auto windows = tilekeep::discover(ws, filter, tilekeep::NO_WINDOW, excluded);

    std::cout << windows.size() << " windows (" << filter.display_name() << ")\n";
    for (auto const& win : windows)
    {
        std::cout << "  [" << tilekeep::category_short_label(win.category) << "] " << std::left << std::setw(18)
                  << win.process_name << " " << win.rect.width << "x" << win.rect.height << "+" << win.rect.x << "+"
                  << win.rect.y << (win.is_minimized ? " (minimized) " : " ") << win.title << "\n";
    }
    return 0;
}

int run_track(tilekeep::Config const& config)
{
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);

    tilekeep::ActivityTracker tracker(tracker_options(config, false), std::make_unique<tilekeep::X11WindowSystem>());
    LOG_INFO("Tracking focus activity, press Ctrl+C to stop");

    while (!g_stop_requested)
    {
        tracker.update();
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    tracker.update();
    for (auto const& [app, session] : tracker.session_stats())
    {
        LOG_INFO("{}: {:.0f}s focused, {} switches", app, session.focus_secs, session.switch_count);
    }
    return 0;
}

int run_stats(tilekeep::Config const& config, std::vector<std::string> const& args)
{
    size_t count = 10;
    if (!args.empty())
    {
        std::string const& arg = args.front();
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), count);
        if (ec != std::errc() || ptr != arg.data() + arg.size())
        {
            std::cerr << "Invalid count: '" << arg << "'\n";
            return 1;
        }
    }

    tilekeep::ActivityTracker tracker(tracker_options(config, true));
    auto top = tracker.top_apps(count);
    if (top.empty())
    {
        std::cout << "No activity recorded yet\n";
        return 0;
    }

    auto db = tracker.snapshot();
    size_t rank = 1;
    for (auto const& [app, score] : top)
    {
        auto const& record = db.apps.at(app);
        auto category = tilekeep::parse_category(record.category).value_or(tilekeep::AppCategory::Other);
        std::cout << std::right << std::setw(3) << rank++ << ". " << std::left << std::setw(20) << app << " score "
                  << std::fixed << std::setprecision(1) << std::setw(6) << score << "  " << std::setprecision(1)
                  << record.total_focus_secs / 3600.0 << "h focused, " << record.total_switches << " switches  ["
                  << tilekeep::category_short_label(category) << "]\n";
    }
    return 0;
}

int run_presets(tilekeep::Config const& config)
{
    std::cout << "Built-in:\n";
    for (auto const& builtin : tilekeep::builtin_presets())
    {
        std::cout << "  " << std::left << std::setw(16) << builtin.name << " " << builtin.preset.spec_string()
                  << "\n";
    }

    if (!config.layouts.empty())
    {
        std::cout << "Layouts:\n";
        for (auto const& def : config.layouts)
        {
            if (auto preset = def.to_preset())
            {
                std::cout << "  " << std::left << std::setw(16) << def.name << " " << preset->spec_string()
                          << "\n";
            }
        }
    }

    if (!config.saved_grids.empty())
    {
        std::cout << "Saved grids:\n";
        for (auto const& grid : config.saved_grids)
        {
            std::cout << "  " << std::left << std::setw(16) << grid.name << " " << grid.cols << "x" << grid.rows;
            if (!grid.disabled_cells.empty())
                std::cout << " (" << grid.disabled_cells.size() << " disabled)";
            std::cout << "\n";
        }
    }
    return 0;
}

}

int main(int argc, char* argv[])
{
    std::string config_override;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (command.empty() && (arg == "--config" || arg == "-c"))
        {
            if (i + 1 >= argc)
            {
                usage(argv[0]);
                return 1;
            }
            config_override = argv[++i];
        }
        else if (command.empty() && (arg == "--verbose" || arg == "-v"))
        {
            verbose = true;
        }
        else if (command.empty() && (arg == "--help" || arg == "-h"))
        {
            usage(argv[0]);
            return 0;
        }
        else if (command.empty())
        {
            command = arg;
        }
        else
        {
            args.push_back(arg);
        }
    }

    if (command.empty())
    {
        usage(argv[0]);
        return 1;
    }

    tilekeep::log::init(verbose);

    int status = 0;
    try
    {
        tilekeep::Config config = load_config_or_defaults(config_override);

        if (command == "arrange")
            status = run_arrange(config, args);
        else if (command == "list")
            status = run_list(config);
        else if (command == "track")
            status = run_track(config);
        else if (command == "stats")
            status = run_stats(config, args);
        else if (command == "presets")
            status = run_presets(config);
        else
        {
            std::cerr << "Unknown command: " << command << "\n";
            usage(argv[0]);
            status = 1;
        }
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        tilekeep::log::shutdown();
        return 1;
    }

    tilekeep::log::shutdown();
    return status;
}
