#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/animation.hpp"
#include "core/layout.hpp"

class Label;

// iOS style on/off switch. The thumb slides across the track over 200 ms.
// With text, the caption sits on the left and the switch on the right.
class ToggleSwitch : public AnimatedWidget {
public:
    static constexpr int kSwitchWidth = 50;
    static constexpr int kSwitchHeight = 24;
    static constexpr int kThumbSize = 20;
    static constexpr int kThumbMargin = 2;
    static constexpr int kTextWidth = 100;
    static constexpr Uint32 kAnimationMs = 200;

    explicit ToggleSwitch(bool checked = false, const std::string& text = {});

    void toggle() { set_checked(!checked_); }
    // Emits toggled only when the state changes.
    void set_checked(bool checked);
    bool is_checked() const { return checked_; }
    void set_text(const std::string& t) { text_ = t; }
    const std::string& text() const { return text_; }
    void set_animation_duration(Uint32 ms) { duration_ = ms; }

    // 0 = off, 1 = on.
    float thumb_position() const { return thumb_; }
    SDL_Rect switch_rect() const;
    SDL_Rect thumb_rect() const;

    void set_on_toggled(std::function<void(bool)> cb) { on_toggled_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    virtual void render_thumb(SDL_Renderer* r, const SDL_Rect& thumb, float alpha) const;

    std::string text_;
    bool checked_;
    float thumb_;
    Uint32 duration_ = kAnimationMs;
    ClickTracker click_;
    std::function<void(bool)> on_toggled_{};
};

// Switch flanked by an off caption and an on caption; the active one is bold
// and drawn in the primary color.
class LabeledToggleSwitch : public Widget {
public:
    LabeledToggleSwitch(const std::string& on_text = "ON", const std::string& off_text = "OFF",
                        bool checked = false);

    void set_checked(bool checked);
    bool is_checked() const;
    void set_labels(const std::string& on_text, const std::string& off_text);
    ToggleSwitch* toggle_switch() const { return switch_; }
    Label* on_label() const { return on_label_; }
    Label* off_label() const { return off_label_; }

    void set_on_toggled(std::function<void(bool)> cb) { on_toggled_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    void update_labels();

    std::unique_ptr<BoxLayout> layout_;
    Label* off_label_ = nullptr;
    Label* on_label_ = nullptr;
    ToggleSwitch* switch_ = nullptr;
    std::function<void(bool)> on_toggled_{};
};

// Switch whose thumb carries an icon for each state.
class IconToggleSwitch : public ToggleSwitch {
public:
    IconToggleSwitch(const std::string& on_icon = "check", const std::string& off_icon = "close",
                     bool checked = false);

    const std::string& on_icon() const { return on_icon_; }
    const std::string& off_icon() const { return off_icon_; }
    const std::string& current_icon() const { return checked_ ? on_icon_ : off_icon_; }

protected:
    void render_thumb(SDL_Renderer* r, const SDL_Rect& thumb, float alpha) const override;

private:
    std::string on_icon_;
    std::string off_icon_;
};

// Column of named switches.
class ToggleSwitchGroup : public Widget {
public:
    ToggleSwitchGroup();

    // Adding an existing key returns that switch unchanged.
    ToggleSwitch* add_switch(const std::string& key, const std::string& text, bool checked = false);
    std::map<std::string, bool> get_states() const;
    bool set_state(const std::string& key, bool checked);
    void set_states(const std::map<std::string, bool>& states);
    ToggleSwitch* get_switch(const std::string& key) const;
    size_t count() const { return switches_.size(); }

    void set_on_state_changed(std::function<void(const std::string&, bool)> cb) { on_state_changed_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    std::unique_ptr<BoxLayout> layout_;
    std::vector<std::pair<std::string, ToggleSwitch*>> switches_;
    std::function<void(const std::string&, bool)> on_state_changed_{};
};
