#include "theme_manager.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

std::map<std::string, FontRole> default_fonts() {
    return {
        {"default", FontRole{9, false, false}},
        {"heading", FontRole{12, true, false}},
        {"caption", FontRole{8, false, false}},
        {"code", FontRole{9, false, true}},
    };
}

std::map<std::string, int> default_spacing() {
    return {{"xs", 4}, {"sm", 8}, {"md", 16}, {"lg", 24}, {"xl", 32}};
}

std::map<std::string, int> default_radius() {
    return {{"sm", 4}, {"md", 8}, {"lg", 12}, {"xl", 16}};
}

int point_to_pixel(int pt) { return std::max(1, pt * 4 / 3); }

}

nlohmann::json Theme::to_json() const {
    nlohmann::json j;
    j["colors"] = nlohmann::json::object();
    for (const auto& kv : colors) {
        j["colors"][kv.first] = wk::to_hex(kv.second);
    }
    j["fonts"] = nlohmann::json::object();
    for (const auto& kv : fonts) {
        j["fonts"][kv.first] = {{"size", kv.second.point_size},
                                {"bold", kv.second.bold},
                                {"monospace", kv.second.monospace}};
    }
    j["spacing"] = spacing;
    j["radius"] = radius;
    return j;
}

Theme Theme::from_json(const nlohmann::json& j, const Theme& base) {
    Theme t = base;
    if (j.contains("colors") && j["colors"].is_object()) {
        for (auto it = j["colors"].begin(); it != j["colors"].end(); ++it) {
            if (!it.value().is_string()) continue;
            t.colors[it.key()] = wk::parse_hex(it.value().get<std::string>());
        }
    }
    if (j.contains("fonts") && j["fonts"].is_object()) {
        for (auto it = j["fonts"].begin(); it != j["fonts"].end(); ++it) {
            FontRole role = t.fonts.count(it.key()) ? t.fonts[it.key()] : FontRole{};
            const auto& v = it.value();
            if (v.is_number_integer()) {
                role.point_size = v.get<int>();
            } else if (v.is_object()) {
                role.point_size = v.value("size", role.point_size);
                role.bold = v.value("bold", role.bold);
                role.monospace = v.value("monospace", role.monospace);
            }
            t.fonts[it.key()] = role;
        }
    }
    if (j.contains("spacing") && j["spacing"].is_object()) {
        for (auto it = j["spacing"].begin(); it != j["spacing"].end(); ++it) {
            if (it.value().is_number_integer()) t.spacing[it.key()] = it.value().get<int>();
        }
    }
    if (j.contains("radius") && j["radius"].is_object()) {
        for (auto it = j["radius"].begin(); it != j["radius"].end(); ++it) {
            if (it.value().is_number_integer()) t.radius[it.key()] = it.value().get<int>();
        }
    }
    return t;
}

ThemeManager& ThemeManager::instance() {
    static ThemeManager manager;
    return manager;
}

ThemeManager::ThemeManager()
    : font_path_(wk::FONT_PATH), mono_font_path_(wk::MONO_FONT_PATH) {
    themes_["light"] = light_theme();
    themes_["dark"] = dark_theme();
}

Theme ThemeManager::light_theme() {
    Theme t;
    t.colors = {
        {"primary", wk::parse_hex("#007ACC")},
        {"secondary", wk::parse_hex("#6C757D")},
        {"success", wk::parse_hex("#28A745")},
        {"warning", wk::parse_hex("#FFC107")},
        {"danger", wk::parse_hex("#DC3545")},
        {"info", wk::parse_hex("#17A2B8")},
        {"light", wk::parse_hex("#F8F9FA")},
        {"dark", wk::parse_hex("#343A40")},
        {"background", wk::parse_hex("#FFFFFF")},
        {"surface", wk::parse_hex("#F5F5F5")},
        {"text", wk::parse_hex("#212529")},
        {"text_secondary", wk::parse_hex("#6C757D")},
        {"border", wk::parse_hex("#DEE2E6")},
        {"hover", wk::parse_hex("#E9ECEF")},
    };
    t.fonts = default_fonts();
    t.spacing = default_spacing();
    t.radius = default_radius();
    return t;
}

Theme ThemeManager::dark_theme() {
    Theme t;
    t.colors = {
        {"primary", wk::parse_hex("#0D7377")},
        {"secondary", wk::parse_hex("#495057")},
        {"success", wk::parse_hex("#198754")},
        {"warning", wk::parse_hex("#FD7E14")},
        {"danger", wk::parse_hex("#DC3545")},
        {"info", wk::parse_hex("#0DCAF0")},
        {"light", wk::parse_hex("#F8F9FA")},
        {"dark", wk::parse_hex("#212529")},
        {"background", wk::parse_hex("#1E1E1E")},
        {"surface", wk::parse_hex("#2D2D2D")},
        {"text", wk::parse_hex("#FFFFFF")},
        {"text_secondary", wk::parse_hex("#B0B0B0")},
        {"border", wk::parse_hex("#404040")},
        {"hover", wk::parse_hex("#3A3A3A")},
    };
    t.fonts = default_fonts();
    t.spacing = default_spacing();
    t.radius = default_radius();
    return t;
}

bool ThemeManager::set_theme(const std::string& name) {
    if (themes_.find(name) == themes_.end()) {
        return false;
    }
    current_ = name;
    notify(name);
    return true;
}

std::vector<std::string> ThemeManager::available_themes() const {
    std::vector<std::string> names;
    names.reserve(themes_.size());
    for (const auto& kv : themes_) names.push_back(kv.first);
    return names;
}

const Theme& ThemeManager::theme() const {
    auto it = themes_.find(current_);
    if (it == themes_.end()) {
        return themes_.at("light");
    }
    return it->second;
}

const Theme* ThemeManager::find_theme(const std::string& name) const {
    auto it = themes_.find(name);
    return it == themes_.end() ? nullptr : &it->second;
}

void ThemeManager::register_theme(const std::string& name, Theme theme) {
    if (name.empty()) return;
    themes_[name] = std::move(theme);
    if (name == current_) notify(name);
}

bool ThemeManager::load_theme_file(const std::string& path) {
    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "[ThemeManager] Unable to open theme file " << path << "\n";
            return false;
        }
        nlohmann::json j;
        in >> j;
        const std::string name = j.value("name", std::string{});
        if (name.empty()) {
            std::cerr << "[ThemeManager] Theme file " << path << " has no name\n";
            return false;
        }
        const std::string base_name = j.value("base", std::string{"light"});
        const Theme* base = find_theme(base_name);
        Theme base_theme = base ? *base : light_theme();
        register_theme(name, Theme::from_json(j, base_theme));
        std::cout << "[ThemeManager] Loaded theme '" << name << "' from " << path << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ThemeManager] Failed to load " << path << ": " << e.what() << "\n";
        return false;
    }
}

bool ThemeManager::save_theme_file(const std::string& name, const std::string& path) const {
    const Theme* t = find_theme(name);
    if (!t) return false;
    try {
        nlohmann::json j = t->to_json();
        j["name"] = name;
        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + path + " for writing.");
        }
        out << j.dump(2);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ThemeManager] Failed to save theme '" << name << "': " << e.what() << "\n";
        return false;
    }
}

SDL_Color ThemeManager::color(const std::string& name) const {
    const Theme& t = theme();
    auto it = t.colors.find(name);
    if (it == t.colors.end()) {
        return wk::rgba(0, 0, 0);
    }
    return it->second;
}

std::string ThemeManager::color_hex(const std::string& name) const {
    return wk::to_hex(color(name));
}

LabelStyle ThemeManager::font(const std::string& role) const {
    const Theme& t = theme();
    FontRole fr;
    auto it = t.fonts.find(role);
    if (it != t.fonts.end()) {
        fr = it->second;
    } else {
        auto def = t.fonts.find("default");
        if (def != t.fonts.end()) fr = def->second;
    }
    LabelStyle s{fr.monospace ? mono_font_path_ : font_path_, point_to_pixel(fr.point_size),
                 color("text")};
    s.bold = fr.bold;
    return s;
}

int ThemeManager::spacing(const std::string& key) const {
    const Theme& t = theme();
    auto it = t.spacing.find(key);
    return it == t.spacing.end() ? 8 : it->second;
}

int ThemeManager::border_radius(const std::string& key) const {
    const Theme& t = theme();
    auto it = t.radius.find(key);
    return it == t.radius.end() ? 4 : it->second;
}

bool ThemeManager::is_dark() const {
    SDL_Color bg = color("background");
    return (bg.r * 299 + bg.g * 587 + bg.b * 114) / 1000 < 128;
}

int ThemeManager::add_listener(Listener cb) {
    const int id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(cb));
    return id;
}

void ThemeManager::remove_listener(int id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void ThemeManager::reset() {
    themes_.clear();
    themes_["light"] = light_theme();
    themes_["dark"] = dark_theme();
    font_path_ = wk::FONT_PATH;
    mono_font_path_ = wk::MONO_FONT_PATH;
    current_ = "light";
}

void ThemeManager::notify(const std::string& name) {
    auto snapshot = listeners_;
    for (auto& entry : snapshot) {
        if (entry.second) entry.second(name);
    }
}
