#include "category.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace tilekeep {

namespace {

struct CategoryEntry
{
    std::string_view process;
    AppCategory category;
};

// Process names as reported by /proc/<pid>/comm or the exe basename
constexpr std::array CATEGORY_TABLE = {
    // Terminals
    CategoryEntry{ "alacritty", AppCategory::Terminal },
    CategoryEntry{ "kitty", AppCategory::Terminal },
    CategoryEntry{ "wezterm-gui", AppCategory::Terminal },
    CategoryEntry{ "foot", AppCategory::Terminal },
    CategoryEntry{ "gnome-terminal-server", AppCategory::Terminal },
    CategoryEntry{ "kgx", AppCategory::Terminal },
    CategoryEntry{ "konsole", AppCategory::Terminal },
    CategoryEntry{ "xterm", AppCategory::Terminal },
    CategoryEntry{ "uxterm", AppCategory::Terminal },
    CategoryEntry{ "urxvt", AppCategory::Terminal },
    CategoryEntry{ "st", AppCategory::Terminal },
    CategoryEntry{ "terminator", AppCategory::Terminal },
    CategoryEntry{ "tilix", AppCategory::Terminal },
    CategoryEntry{ "xfce4-terminal", AppCategory::Terminal },
    CategoryEntry{ "mate-terminal", AppCategory::Terminal },
    CategoryEntry{ "lxterminal", AppCategory::Terminal },
    CategoryEntry{ "qterminal", AppCategory::Terminal },
    CategoryEntry{ "sakura", AppCategory::Terminal },
    CategoryEntry{ "terminology", AppCategory::Terminal },
    CategoryEntry{ "ghostty", AppCategory::Terminal },
    CategoryEntry{ "rio", AppCategory::Terminal },
    CategoryEntry{ "warp", AppCategory::Terminal },
    CategoryEntry{ "tabby", AppCategory::Terminal },
    CategoryEntry{ "hyper", AppCategory::Terminal },

    // Browsers
    CategoryEntry{ "firefox", AppCategory::Browser },
    CategoryEntry{ "firefox-esr", AppCategory::Browser },
    CategoryEntry{ "chromium", AppCategory::Browser },
    CategoryEntry{ "chromium-browser", AppCategory::Browser },
    CategoryEntry{ "chrome", AppCategory::Browser },
    CategoryEntry{ "google-chrome", AppCategory::Browser },
    CategoryEntry{ "brave", AppCategory::Browser },
    CategoryEntry{ "brave-browser", AppCategory::Browser },
    CategoryEntry{ "vivaldi-bin", AppCategory::Browser },
    CategoryEntry{ "opera", AppCategory::Browser },
    CategoryEntry{ "librewolf", AppCategory::Browser },
    CategoryEntry{ "waterfox", AppCategory::Browser },
    CategoryEntry{ "epiphany", AppCategory::Browser },
    CategoryEntry{ "falkon", AppCategory::Browser },
    CategoryEntry{ "qutebrowser", AppCategory::Browser },
    CategoryEntry{ "zen", AppCategory::Browser },

    // Editors / IDEs
    CategoryEntry{ "code", AppCategory::Editor },
    CategoryEntry{ "codium", AppCategory::Editor },
    CategoryEntry{ "cursor", AppCategory::Editor },
    CategoryEntry{ "windsurf", AppCategory::Editor },
    CategoryEntry{ "zed", AppCategory::Editor },
    CategoryEntry{ "zed-editor", AppCategory::Editor },
    CategoryEntry{ "sublime_text", AppCategory::Editor },
    CategoryEntry{ "gedit", AppCategory::Editor },
    CategoryEntry{ "gnome-text-editor", AppCategory::Editor },
    CategoryEntry{ "kate", AppCategory::Editor },
    CategoryEntry{ "kwrite", AppCategory::Editor },
    CategoryEntry{ "mousepad", AppCategory::Editor },
    CategoryEntry{ "pluma", AppCategory::Editor },
    CategoryEntry{ "gvim", AppCategory::Editor },
    CategoryEntry{ "nvim-qt", AppCategory::Editor },
    CategoryEntry{ "neovide", AppCategory::Editor },
    CategoryEntry{ "emacs", AppCategory::Editor },
    CategoryEntry{ "idea", AppCategory::Editor },
    CategoryEntry{ "pycharm", AppCategory::Editor },
    CategoryEntry{ "clion", AppCategory::Editor },
    CategoryEntry{ "rider", AppCategory::Editor },

    // Chat / Communication
    CategoryEntry{ "discord", AppCategory::Chat },
    CategoryEntry{ "slack", AppCategory::Chat },
    CategoryEntry{ "teams-for-linux", AppCategory::Chat },
    CategoryEntry{ "telegram-desktop", AppCategory::Chat },
    CategoryEntry{ "signal-desktop", AppCategory::Chat },
    CategoryEntry{ "element-desktop", AppCategory::Chat },
    CategoryEntry{ "zoom", AppCategory::Chat },
    CategoryEntry{ "thunderbird", AppCategory::Chat },

    // Media
    CategoryEntry{ "spotify", AppCategory::Media },
    CategoryEntry{ "vlc", AppCategory::Media },
    CategoryEntry{ "mpv", AppCategory::Media },
    CategoryEntry{ "obs", AppCategory::Media },
    CategoryEntry{ "audacity", AppCategory::Media },
    CategoryEntry{ "rhythmbox", AppCategory::Media },
    CategoryEntry{ "totem", AppCategory::Media },
    CategoryEntry{ "celluloid", AppCategory::Media },
    CategoryEntry{ "strawberry", AppCategory::Media },

    // Games
    CategoryEntry{ "steam", AppCategory::Game },
    CategoryEntry{ "steamwebhelper", AppCategory::Game },
    CategoryEntry{ "lutris", AppCategory::Game },
    CategoryEntry{ "heroic", AppCategory::Game },

    // Dev Tools
    CategoryEntry{ "blender", AppCategory::DevTool },
    CategoryEntry{ "gimp", AppCategory::DevTool },
    CategoryEntry{ "gimp-2.10", AppCategory::DevTool },
    CategoryEntry{ "inkscape", AppCategory::DevTool },
    CategoryEntry{ "krita", AppCategory::DevTool },
    CategoryEntry{ "postman", AppCategory::DevTool },
    CategoryEntry{ "insomnia", AppCategory::DevTool },
    CategoryEntry{ "gitg", AppCategory::DevTool },
    CategoryEntry{ "gitkraken", AppCategory::DevTool },
    CategoryEntry{ "filezilla", AppCategory::DevTool },
    CategoryEntry{ "dbeaver", AppCategory::DevTool },
    CategoryEntry{ "wireshark", AppCategory::DevTool },
    CategoryEntry{ "virt-manager", AppCategory::DevTool },
    CategoryEntry{ "docker-desktop", AppCategory::DevTool },

    // System
    CategoryEntry{ "nautilus", AppCategory::System },
    CategoryEntry{ "nemo", AppCategory::System },
    CategoryEntry{ "caja", AppCategory::System },
    CategoryEntry{ "thunar", AppCategory::System },
    CategoryEntry{ "pcmanfm", AppCategory::System },
    CategoryEntry{ "pcmanfm-qt", AppCategory::System },
    CategoryEntry{ "dolphin", AppCategory::System },
    CategoryEntry{ "gnome-system-monitor", AppCategory::System },
    CategoryEntry{ "plasma-systemmonitor", AppCategory::System },
    CategoryEntry{ "gnome-control-center", AppCategory::System },
    CategoryEntry{ "systemsettings", AppCategory::System },
    CategoryEntry{ "xfce4-settings-manager", AppCategory::System },
};

std::unordered_map<std::string_view, AppCategory> const& category_index()
{
    static std::unordered_map<std::string_view, AppCategory> const index = []
    {
        std::unordered_map<std::string_view, AppCategory> map;
        for (auto const& entry : CATEGORY_TABLE)
            map.emplace(entry.process, entry.category);
        return map;
    }();
    return index;
}

constexpr std::array ALL_CATEGORIES = {
    AppCategory::Terminal, AppCategory::Browser, AppCategory::Editor,
    AppCategory::Chat,     AppCategory::Media,   AppCategory::Game,
    AppCategory::DevTool,  AppCategory::System,  AppCategory::Other,
};

}

std::string to_lower(std::string_view s)
{
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

AppCategory categorize(std::string_view process_name)
{
    auto const& index = category_index();
    auto it = index.find(to_lower(process_name));
    return it != index.end() ? it->second : AppCategory::Other;
}

bool is_terminal_process(std::string_view process_name)
{
    return categorize(process_name) == AppCategory::Terminal;
}

char const* category_display_name(AppCategory category)
{
    switch (category)
    {
        case AppCategory::Terminal:
            return "Terminal";
        case AppCategory::Browser:
            return "Browser";
        case AppCategory::Editor:
            return "Editor";
        case AppCategory::Chat:
            return "Chat";
        case AppCategory::Media:
            return "Media";
        case AppCategory::Game:
            return "Game";
        case AppCategory::DevTool:
            return "DevTool";
        case AppCategory::System:
            return "System";
        case AppCategory::Other:
            break;
    }
    return "Other";
}

char const* category_short_label(AppCategory category)
{
    switch (category)
    {
        case AppCategory::Terminal:
            return "T";
        case AppCategory::Browser:
            return "B";
        case AppCategory::Editor:
            return "E";
        case AppCategory::Chat:
            return "C";
        case AppCategory::Media:
            return "M";
        case AppCategory::Game:
            return "G";
        case AppCategory::DevTool:
            return "D";
        case AppCategory::System:
            return "S";
        case AppCategory::Other:
            break;
    }
    return "?";
}

std::optional<AppCategory> parse_category(std::string_view display_name)
{
    std::string lower = to_lower(display_name);
    for (AppCategory category : ALL_CATEGORIES)
    {
        if (to_lower(category_display_name(category)) == lower)
            return category;
    }
    return std::nullopt;
}

} // namespace tilekeep
