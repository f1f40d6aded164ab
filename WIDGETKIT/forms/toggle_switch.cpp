#include "toggle_switch.hpp"

#include <algorithm>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr float kDisabledAlpha = 0.5f;
}

ToggleSwitch::ToggleSwitch(bool checked, const std::string& text)
    : text_(text), checked_(checked), thumb_(checked ? 1.0f : 0.0f) {}

void ToggleSwitch::set_checked(bool checked) {
    if (checked == checked_) return;
    checked_ = checked;
    animate("thumb", thumb_, checked_ ? 1.0f : 0.0f, duration_, [this](float v) { thumb_ = v; });
    if (on_toggled_) on_toggled_(checked_);
}

SDL_Rect ToggleSwitch::switch_rect() const {
    const int x = text_.empty() ? rect_.x : rect_.x + rect_.w - kSwitchWidth;
    return SDL_Rect{ x, rect_.y + (rect_.h - kSwitchHeight) / 2, kSwitchWidth, kSwitchHeight };
}

SDL_Rect ToggleSwitch::thumb_rect() const {
    const SDL_Rect sw = switch_rect();
    const int travel = kSwitchWidth - kThumbSize - 2 * kThumbMargin;
    const int x = sw.x + kThumbMargin + static_cast<int>(travel * thumb_ + 0.5f);
    return SDL_Rect{ x, sw.y + kThumbMargin, kThumbSize, kThumbSize };
}

int ToggleSwitch::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return kSwitchWidth + (text_.empty() ? 0 : kTextWidth);
}

int ToggleSwitch::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kSwitchHeight;
}

bool ToggleSwitch::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Clicked:
        toggle();
        return true;
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    default:
        return false;
    }
}

void ToggleSwitch::render_thumb(SDL_Renderer* r, const SDL_Rect& thumb, float alpha) const {
    const int radius = kThumbSize / 2;
    wk_draw::fill_circle(r, thumb.x + radius, thumb.y + radius + 1, radius, wk::rgba(0, 0, 0, 40), alpha);
    wk_draw::fill_circle(r, thumb.x + radius, thumb.y + radius, radius, wk::rgba(255, 255, 255), alpha);
}

void ToggleSwitch::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    if (!text_.empty()) {
        SDL_Rect text_area{ rect_.x, rect_.y, rect_.w - kSwitchWidth - 8, rect_.h };
        wk_text::draw_in_rect(r, Styles::Label(), text_, text_area, wk_text::Align::Left, alpha);
    }
    const SDL_Rect sw = switch_rect();
    const SDL_Color track = wk::mix(tm.color("border"), tm.color("primary"), thumb_);
    wk_draw::fill_rounded_rect(r, sw, kSwitchHeight / 2, hovered_ ? wk::lighten(track, 0.08f) : track, alpha);
    render_thumb(r, thumb_rect(), alpha);
}

LabeledToggleSwitch::LabeledToggleSwitch(const std::string& on_text, const std::string& off_text, bool checked)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8)) {
    layout_->set_parent(this);
    layout_->set_alignment(BoxLayout::Align::Center);
    off_label_ = layout_->add_widget(std::make_unique<Label>(off_text, "caption"));
    auto sw = std::make_unique<ToggleSwitch>(checked);
    sw->set_on_toggled([this](bool on) {
        update_labels();
        if (on_toggled_) on_toggled_(on);
    });
    switch_ = layout_->add_widget(std::move(sw));
    on_label_ = layout_->add_widget(std::make_unique<Label>(on_text, "caption"));
    update_labels();
}

void LabeledToggleSwitch::set_checked(bool checked) {
    switch_->set_checked(checked);
}

bool LabeledToggleSwitch::is_checked() const {
    return switch_->is_checked();
}

void LabeledToggleSwitch::set_labels(const std::string& on_text, const std::string& off_text) {
    on_label_->set_text(on_text);
    off_label_->set_text(off_text);
    layout();
}

void LabeledToggleSwitch::update_labels() {
    const bool on = switch_->is_checked();
    on_label_->set_color_role(on ? "primary" : "text_secondary");
    on_label_->set_bold(on);
    off_label_->set_color_role(on ? "text_secondary" : "primary");
    off_label_->set_bold(!on);
}

bool LabeledToggleSwitch::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void LabeledToggleSwitch::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}

IconToggleSwitch::IconToggleSwitch(const std::string& on_icon, const std::string& off_icon, bool checked)
    : ToggleSwitch(checked), on_icon_(on_icon), off_icon_(off_icon) {}

void IconToggleSwitch::render_thumb(SDL_Renderer* r, const SDL_Rect& thumb, float alpha) const {
    ToggleSwitch::render_thumb(r, thumb, alpha);
    const ThemeManager& tm = ThemeManager::instance();
    const SDL_Color c = checked_ ? tm.color("primary") : tm.color("text_secondary");
    wk_icons::draw(r, current_icon(), wk_draw::inset(thumb, 5, 5), c, alpha);
}

ToggleSwitchGroup::ToggleSwitchGroup() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
}

ToggleSwitch* ToggleSwitchGroup::add_switch(const std::string& key, const std::string& text, bool checked) {
    if (ToggleSwitch* existing = get_switch(key)) return existing;
    auto sw = std::make_unique<ToggleSwitch>(checked, text);
    sw->set_on_toggled([this, key](bool on) {
        if (on_state_changed_) on_state_changed_(key, on);
    });
    ToggleSwitch* raw = layout_->add_widget(std::move(sw));
    switches_.emplace_back(key, raw);
    layout();
    return raw;
}

std::map<std::string, bool> ToggleSwitchGroup::get_states() const {
    std::map<std::string, bool> states;
    for (const auto& kv : switches_) states[kv.first] = kv.second->is_checked();
    return states;
}

bool ToggleSwitchGroup::set_state(const std::string& key, bool checked) {
    ToggleSwitch* sw = get_switch(key);
    if (!sw) return false;
    sw->set_checked(checked);
    return true;
}

void ToggleSwitchGroup::set_states(const std::map<std::string, bool>& states) {
    for (const auto& kv : states) set_state(kv.first, kv.second);
}

ToggleSwitch* ToggleSwitchGroup::get_switch(const std::string& key) const {
    auto it = std::find_if(switches_.begin(), switches_.end(),
                           [&](const std::pair<std::string, ToggleSwitch*>& s) { return s.first == key; });
    return it == switches_.end() ? nullptr : it->second;
}

bool ToggleSwitchGroup::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void ToggleSwitchGroup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
