#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "styles.hpp"

struct FontRole {
    int point_size = 9;
    bool bold = false;
    bool monospace = false;
};

struct Theme {
    std::map<std::string, SDL_Color> colors;
    std::map<std::string, FontRole> fonts;
    std::map<std::string, int> spacing;
    std::map<std::string, int> radius;

    nlohmann::json to_json() const;
    // Keys missing from `j` keep the values already in `base`.
    static Theme from_json(const nlohmann::json& j, const Theme& base);
};

// Process-wide registry of themes. Widgets query it at render time so a theme
// switch shows up on the next frame.
class ThemeManager {
public:
    using Listener = std::function<void(const std::string&)>;

    static ThemeManager& instance();

    static Theme light_theme();
    static Theme dark_theme();

    bool set_theme(const std::string& name);
    const std::string& current_theme() const { return current_; }
    std::vector<std::string> available_themes() const;
    const Theme& theme() const;
    const Theme* find_theme(const std::string& name) const;

    void register_theme(const std::string& name, Theme theme);
    bool load_theme_file(const std::string& path);
    bool save_theme_file(const std::string& name, const std::string& path) const;

    SDL_Color color(const std::string& name) const;
    std::string color_hex(const std::string& name) const;
    // Point size converted to pixels (pt * 4 / 3).
    LabelStyle font(const std::string& role) const;
    int spacing(const std::string& key) const;
    int border_radius(const std::string& key) const;
    bool is_dark() const;

    void set_font_path(const std::string& path) { font_path_ = path; }
    const std::string& font_path() const { return font_path_; }
    void set_mono_font_path(const std::string& path) { mono_font_path_ = path; }

    int add_listener(Listener cb);
    void remove_listener(int id);

    // Restores the built-in themes and the light theme. Listeners are kept.
    void reset();

private:
    ThemeManager();
    void notify(const std::string& name);

    std::map<std::string, Theme> themes_;
    std::string current_ = "light";
    std::string font_path_;
    std::string mono_font_path_;
    std::vector<std::pair<int, Listener>> listeners_;
    int next_listener_id_ = 1;
};
