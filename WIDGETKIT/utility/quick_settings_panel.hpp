#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/animation.hpp"

class BaseButton;
class BoxLayout;
class Dropdown;
class IconButton;
class Slider;
class ToggleSwitch;

// Collapsible panel of named settings. Values are JSON: toggles hold a
// bool, sliders an integer and choices the selected option text.
class QuickSettingsPanel : public AnimatedWidget {
public:
    static constexpr Uint32 kCollapseMs = 300;
    static constexpr int kPanelWidth = 300;

    explicit QuickSettingsPanel(const std::string& title = "Settings", bool collapsible = true);
    ~QuickSettingsPanel() override;

    // Adding a key that already exists returns nullptr.
    ToggleSwitch* add_toggle(const std::string& key, const std::string& label, bool value = false,
                             const std::string& description = {});
    Slider* add_slider(const std::string& key, const std::string& label, int min_val = 0, int max_val = 100,
                       int value = 50, const std::string& description = {});
    Dropdown* add_choice(const std::string& key, const std::string& label, const std::vector<std::string>& options,
                         int index = 0, const std::string& description = {});

    bool has_setting(const std::string& key) const;
    std::vector<std::string> keys() const;
    // Null for unknown keys.
    nlohmann::json get_setting(const std::string& key) const;
    // Updates the control; setting_changed follows when the value differs.
    // Choices accept the option text or its index. Returns false for unknown
    // keys and values of the wrong type.
    bool set_setting(const std::string& key, const nlohmann::json& value);

    nlohmann::json export_settings() const;
    // Applies every known key. Returns false when the data is not an object
    // or any value was rejected.
    bool import_settings(const nlohmann::json& data);
    // Back to the values the settings were added with.
    void reset_settings();
    // Emits settings_applied with export_settings().
    void apply_settings();

    void toggle_panel() { set_expanded(!expanded_); }
    void set_expanded(bool expanded);
    bool is_expanded() const { return expanded_; }
    // 0 = collapsed to the header, 1 = fully open.
    float expand_progress() const { return progress_; }
    bool is_collapsible() const { return collapsible_; }
    const std::string& title() const { return title_; }

    BaseButton* reset_button() const { return reset_button_; }
    BaseButton* apply_button() const { return apply_button_; }
    IconButton* toggle_button() const { return toggle_button_; }
    Widget* control(const std::string& key) const;

    void set_on_setting_changed(std::function<void(const std::string&, const nlohmann::json&)> cb) {
        on_setting_changed_ = std::move(cb);
    }
    void set_on_settings_applied(std::function<void(const nlohmann::json&)> cb) { on_settings_applied_ = std::move(cb); }
    void set_on_panel_toggled(std::function<void(bool)> cb) { on_panel_toggled_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    enum class Kind { Toggle, Slider, Choice };

    struct Entry {
        std::string key;
        Kind kind;
        nlohmann::json default_value;
        Widget* control = nullptr;
    };

    const Entry* find(const std::string& key) const;
    BoxLayout* add_group(const std::string& label, const std::string& description, bool inline_control);
    void emit_changed(const std::string& key, const nlohmann::json& value);
    void apply_progress(float p);

    std::string title_;
    bool collapsible_;
    bool expanded_ = true;
    float progress_ = 1.0f;
    std::unique_ptr<BoxLayout> header_;
    IconButton* toggle_button_ = nullptr;
    std::unique_ptr<BoxLayout> body_;
    BoxLayout* content_ = nullptr;
    BaseButton* reset_button_ = nullptr;
    BaseButton* apply_button_ = nullptr;
    std::vector<Entry> entries_;
    std::function<void(const std::string&, const nlohmann::json&)> on_setting_changed_{};
    std::function<void(const nlohmann::json&)> on_settings_applied_{};
    std::function<void(bool)> on_panel_toggled_{};
};
