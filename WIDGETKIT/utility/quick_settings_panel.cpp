#include "quick_settings_panel.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "forms/slider.hpp"
#include "forms/toggle_switch.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRadius = 6;
constexpr int kToggleIcon = 24;
}

QuickSettingsPanel::QuickSettingsPanel(const std::string& title, bool collapsible)
    : title_(title),
      collapsible_(collapsible),
      header_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8)),
      body_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0)) {
    header_->set_parent(this);
    header_->set_margins(12, 8, 8, 8);
    header_->set_alignment(BoxLayout::Align::Center);
    auto* title_label = header_->add_widget(std::make_unique<Label>(title, "heading", "text"));
    title_label->set_bold(true);
    header_->add_stretch();
    toggle_button_ = header_->add_widget(std::make_unique<IconButton>("chevron-down", kToggleIcon));
    toggle_button_->set_on_clicked([this]() { toggle_panel(); });
    toggle_button_->set_visible(collapsible_);

    body_->set_parent(this);
    body_->add_widget(std::make_unique<Separator>());
    auto content = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 12);
    content->set_margins(12, 8, 12, 8);
    content_ = body_->add_widget(std::move(content));
    body_->add_widget(std::make_unique<Separator>());
    auto buttons = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    buttons->set_margins(12, 8, 12, 8);
    reset_button_ = buttons->add_widget(std::make_unique<BaseButton>("Reset", ButtonVariant::Secondary, ButtonSize::Small));
    reset_button_->set_on_clicked([this]() { reset_settings(); });
    buttons->add_stretch();
    apply_button_ = buttons->add_widget(std::make_unique<BaseButton>("Apply", ButtonVariant::Primary, ButtonSize::Small));
    apply_button_->set_on_clicked([this]() { apply_settings(); });
    body_->add_widget(std::move(buttons));
}

QuickSettingsPanel::~QuickSettingsPanel() = default;

BoxLayout* QuickSettingsPanel::add_group(const std::string& label, const std::string& description,
                                         bool inline_control) {
    auto text = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2);
    text->add_widget(std::make_unique<Label>(label, "default", "text"));
    if (!description.empty()) {
        auto* desc = text->add_widget(std::make_unique<Label>(description, "caption", "text_secondary"));
        desc->set_word_wrap(true);
    }
    if (inline_control) {
        auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12);
        row->set_alignment(BoxLayout::Align::Center);
        row->add_widget(std::move(text), 1);
        return content_->add_widget(std::move(row));
    }
    text->set_spacing(4);
    return content_->add_widget(std::move(text));
}

ToggleSwitch* QuickSettingsPanel::add_toggle(const std::string& key, const std::string& label, bool value,
                                             const std::string& description) {
    if (key.empty() || has_setting(key)) return nullptr;
    BoxLayout* group = add_group(label, description, true);
    auto* toggle = group->add_widget(std::make_unique<ToggleSwitch>(value));
    toggle->set_on_toggled([this, key](bool on) { emit_changed(key, on); });
    entries_.push_back(Entry{ key, Kind::Toggle, value, toggle });
    layout();
    return toggle;
}

Slider* QuickSettingsPanel::add_slider(const std::string& key, const std::string& label, int min_val, int max_val,
                                       int value, const std::string& description) {
    if (key.empty() || has_setting(key)) return nullptr;
    BoxLayout* group = add_group(label, description, false);
    auto* slider = group->add_widget(std::make_unique<Slider>(min_val, max_val, value));
    slider->set_on_value_changed([this, key](int v) { emit_changed(key, v); });
    entries_.push_back(Entry{ key, Kind::Slider, slider->value(), slider });
    layout();
    return slider;
}

Dropdown* QuickSettingsPanel::add_choice(const std::string& key, const std::string& label,
                                         const std::vector<std::string>& options, int index,
                                         const std::string& description) {
    if (key.empty() || has_setting(key)) return nullptr;
    BoxLayout* group = add_group(label, description, false);
    const int count = static_cast<int>(options.size());
    const int idx = count == 0 ? -1 : std::max(0, std::min(index, count - 1));
    auto* dropdown = group->add_widget(std::make_unique<Dropdown>(options, idx));
    dropdown->set_on_changed([this, key](int, const std::string& text) { emit_changed(key, text); });
    const nlohmann::json initial = idx < 0 ? nlohmann::json() : nlohmann::json(options[static_cast<size_t>(idx)]);
    entries_.push_back(Entry{ key, Kind::Choice, initial, dropdown });
    layout();
    return dropdown;
}

const QuickSettingsPanel::Entry* QuickSettingsPanel::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

bool QuickSettingsPanel::has_setting(const std::string& key) const { return find(key) != nullptr; }

std::vector<std::string> QuickSettingsPanel::keys() const {
    std::vector<std::string> out;
    for (const auto& entry : entries_) out.push_back(entry.key);
    return out;
}

Widget* QuickSettingsPanel::control(const std::string& key) const {
    const Entry* entry = find(key);
    return entry ? entry->control : nullptr;
}

nlohmann::json QuickSettingsPanel::get_setting(const std::string& key) const {
    const Entry* entry = find(key);
    if (!entry) return nlohmann::json();
    switch (entry->kind) {
    case Kind::Toggle:
        return static_cast<const ToggleSwitch*>(entry->control)->is_checked();
    case Kind::Slider:
        return static_cast<const Slider*>(entry->control)->value();
    case Kind::Choice: {
        const auto* dropdown = static_cast<const Dropdown*>(entry->control);
        return dropdown->selected() < 0 ? nlohmann::json() : nlohmann::json(dropdown->selected_text());
    }
    }
    return nlohmann::json();
}

bool QuickSettingsPanel::set_setting(const std::string& key, const nlohmann::json& value) {
    const Entry* entry = find(key);
    if (!entry) return false;
    switch (entry->kind) {
    case Kind::Toggle:
        if (!value.is_boolean()) return false;
        static_cast<ToggleSwitch*>(entry->control)->set_checked(value.get<bool>());
        return true;
    case Kind::Slider:
        if (!value.is_number()) return false;
        static_cast<Slider*>(entry->control)->set_value(static_cast<int>(std::lround(value.get<double>())));
        return true;
    case Kind::Choice: {
        auto* dropdown = static_cast<Dropdown*>(entry->control);
        if (value.is_string()) return dropdown->set_selected_text(value.get<std::string>());
        if (value.is_number_integer()) {
            const int idx = value.get<int>();
            if (idx < 0 || idx >= static_cast<int>(dropdown->options().size())) return false;
            dropdown->set_selected(idx);
            return true;
        }
        return false;
    }
    }
    return false;
}

nlohmann::json QuickSettingsPanel::export_settings() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& entry : entries_) out[entry.key] = get_setting(entry.key);
    return out;
}

bool QuickSettingsPanel::import_settings(const nlohmann::json& data) {
    if (!data.is_object()) {
        std::cerr << "[QuickSettingsPanel] Settings must be a JSON object\n";
        return false;
    }
    bool ok = true;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!has_setting(it.key())) continue;
        if (!set_setting(it.key(), it.value())) {
            std::cerr << "[QuickSettingsPanel] Rejected value for " << it.key() << ": " << it.value().dump() << "\n";
            ok = false;
        }
    }
    return ok;
}

void QuickSettingsPanel::reset_settings() {
    for (const auto& entry : entries_) {
        if (!entry.default_value.is_null()) set_setting(entry.key, entry.default_value);
    }
}

void QuickSettingsPanel::apply_settings() {
    if (on_settings_applied_) on_settings_applied_(export_settings());
}

void QuickSettingsPanel::emit_changed(const std::string& key, const nlohmann::json& value) {
    if (on_setting_changed_) on_setting_changed_(key, value);
}

void QuickSettingsPanel::set_expanded(bool expanded) {
    if (!collapsible_ || expanded == expanded_) return;
    expanded_ = expanded;
    toggle_button_->set_icon(expanded_ ? "chevron-down" : "chevron-right");
    const float target = expanded_ ? 1.0f : 0.0f;
    if (expanded_) body_->show();
    animate("expand", progress_, target, kCollapseMs,
            [this](float v) {
                progress_ = v;
                layout();
            },
            [this, target]() { apply_progress(target); });
    if (on_panel_toggled_) on_panel_toggled_(expanded_);
}

void QuickSettingsPanel::apply_progress(float p) {
    progress_ = std::max(0.0f, std::min(1.0f, p));
    body_->set_visible(progress_ > 0.0f);
    layout();
}

int QuickSettingsPanel::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max({ kPanelWidth, header_->preferred_width(), body_->preferred_width() });
}

int QuickSettingsPanel::height_for_width(int w) const {
    if (fixed_h_ >= 0) return apply_height_limit(fixed_h_);
    int h = header_->height_for_width(w);
    if (body_->is_visible()) h += static_cast<int>(std::lround(body_->height_for_width(w) * progress_));
    return apply_height_limit(h);
}

void QuickSettingsPanel::layout() {
    const int hh = header_->height_for_width(rect_.w);
    header_->set_rect(SDL_Rect{ rect_.x, rect_.y, rect_.w, hh });
    body_->set_rect(SDL_Rect{ rect_.x, rect_.y + hh, rect_.w, body_->height_for_width(rect_.w) });
}

bool QuickSettingsPanel::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (header_->handle_event(e)) return true;
    // Controls are inert while the body slides.
    if (body_->is_visible() && progress_ >= 1.0f && body_->handle_event(e)) return true;
    return false;
}

void QuickSettingsPanel::update() {
    AnimatedWidget::update();
    header_->update();
    if (body_->is_visible()) body_->update();
}

void QuickSettingsPanel::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rounded_rect(r, rect_, kRadius, tm.color("surface"), alpha);
    wk_draw::draw_rounded_rect(r, rect_, kRadius, tm.color("border"), alpha);
    header_->render(r);
    if (!body_->is_visible()) return;
    const SDL_Rect header = header_->rect();
    wk_draw::ClipScope clip(r, SDL_Rect{ rect_.x, header.y + header.h, rect_.w,
                                         std::max(0, rect_.y + rect_.h - header.y - header.h) });
    body_->render(r);
}
