#include "hover_action_card.hpp"

#include <algorithm>
#include <cctype>

#include "base/controls.hpp"
#include "cards/image_card.hpp"

namespace {
constexpr int kQuickIconSize = 40;
constexpr int kThumbnailHeight = 120;
}

HoverActionCard::HoverActionCard(const std::string& title, const std::string& content) {
    if (!title.empty()) set_title(title);
    auto label = std::make_unique<Label>(content, "default", "text_secondary");
    label->set_word_wrap(true);
    content_ = body_->add_widget(std::move(label));
    content_->set_visible(!content.empty());
    footer_->set_opacity(0.0f);
    footer_->set_enabled(false);
}

void HoverActionCard::set_content(const std::string& c) {
    content_->set_text(c);
    content_->set_visible(!c.empty());
}

const std::string& HoverActionCard::content() const {
    return content_->text();
}

BaseButton* HoverActionCard::add_action(const std::string& text, std::function<void()> cb, const std::string& name,
                                        ButtonVariant variant) {
    const std::string key = name.empty() ? text : name;
    auto button = std::make_unique<BaseButton>(text, variant, ButtonSize::Small);
    button->set_on_clicked([this, key, cb]() {
        if (cb) cb();
        if (on_action_triggered_) on_action_triggered_(key);
    });
    BaseButton* raw = static_cast<BaseButton*>(add_footer_widget(std::move(button)));
    actions_.emplace_back(key, raw);
    return raw;
}

bool HoverActionCard::remove_action(const std::string& name) {
    auto it = std::find_if(actions_.begin(), actions_.end(),
                           [&](const std::pair<std::string, BaseButton*>& a) { return a.first == name; });
    if (it == actions_.end()) return false;
    footer_->remove(it->second);
    actions_.erase(it);
    if (actions_.empty()) footer_->hide();
    return true;
}

void HoverActionCard::clear_actions() {
    footer_->clear();
    footer_->hide();
    actions_.clear();
}

std::vector<std::string> HoverActionCard::action_names() const {
    std::vector<std::string> out;
    for (const auto& a : actions_) out.push_back(a.first);
    return out;
}

BaseButton* HoverActionCard::action(const std::string& name) const {
    for (const auto& a : actions_) {
        if (a.first == name) return a.second;
    }
    return nullptr;
}

void HoverActionCard::on_hover_changed(bool hovered) {
    BaseCard::on_hover_changed(hovered);
    if (hovered) show_actions();
    else hide_actions();
}

void HoverActionCard::show_actions() {
    if (actions_.empty() || actions_shown_) return;
    actions_shown_ = true;
    footer_->set_enabled(true);
    animate("actions", footer_->opacity(), 1.0f, kShowMs, [this](float v) { footer_->set_opacity(v); });
}

void HoverActionCard::hide_actions() {
    if (!actions_shown_) return;
    actions_shown_ = false;
    footer_->set_enabled(false);
    animate("actions", footer_->opacity(), 0.0f, kHideMs, [this](float v) { footer_->set_opacity(v); });
}

QuickActionCard::QuickActionCard(const std::string& title, const std::string& icon, const std::string& description)
    : HoverActionCard() {
    body_->set_alignment(BoxLayout::Align::Center);
    body_->set_spacing(Spacing::label_gap());
    icon_ = static_cast<IconGlyph*>(body_->insert(0, std::make_unique<IconGlyph>(icon, kQuickIconSize, "primary")));
    icon_->set_visible(!icon.empty());
    auto label = std::make_unique<Label>(title, "default");
    label->set_bold(true);
    label->set_alignment(wk_text::Align::Center);
    body_->insert(1, std::move(label));
    content_->set_alignment(wk_text::Align::Center);
    set_content(description);
}

void QuickActionCard::set_icon(const std::string& icon) {
    icon_->set_icon(icon);
    icon_->set_visible(!icon.empty());
}

const std::string& QuickActionCard::icon() const {
    return icon_->icon();
}

MediaCard::MediaCard(const std::string& title, const std::string& description, const std::string& thumbnail)
    : HoverActionCard(title, description) {
    thumbnail_ = static_cast<ImageView*>(body_->insert(0, std::make_unique<ImageView>(thumbnail, kThumbnailHeight)));
    auto play = std::make_unique<IconButton>("play", 32);
    play->set_on_clicked([this]() { toggle_playback(); });
    play_ = static_cast<IconButton*>(add_header_action(std::move(play)));
    auto bar = std::make_unique<ProgressBar>();
    bar->set_fixed_height(4);
    bar_ = body_->add_widget(std::move(bar));
}

void MediaCard::set_playing(bool playing) {
    if (playing == playing_) return;
    playing_ = playing;
    play_->set_icon(playing_ ? "pause" : "play");
    if (on_playback_changed_) on_playback_changed_(playing_);
}

void MediaCard::set_progress(int percent) {
    bar_->set_value(percent);
}

int MediaCard::progress() const {
    return bar_->value();
}

void MediaCard::set_thumbnail(const std::string& path) {
    thumbnail_->set_path(path);
}

ProjectCard::ProjectCard(const std::string& title, const std::string& description, const std::string& status,
                         int progress, int team_count)
    : HoverActionCard(title, description) {
    status_dot_ = static_cast<StatusDot*>(add_header_action(std::make_unique<StatusDot>("success", 10)));
    auto label = std::make_unique<Label>(std::string(), "caption");
    label->set_bold(true);
    status_label_ = static_cast<Label*>(add_header_action(std::move(label)));

    auto bar = std::make_unique<ProgressBar>();
    bar->set_fixed_height(4);
    bar_ = body_->add_widget(std::move(bar));

    auto team = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::label_gap());
    team->add(std::make_unique<IconGlyph>("users", 14, "text_secondary"));
    team_label_ = team->add_widget(std::make_unique<Label>(std::string(), "caption", "text_secondary"));
    body_->add(std::move(team));

    add_action("Open", {}, "open", ButtonVariant::Primary);
    add_action("Edit", {}, "edit", ButtonVariant::Secondary);
    add_action("Settings", {}, "settings", ButtonVariant::Ghost);

    set_status(status);
    set_progress(progress);
    set_team_count(team_count);
}

std::string ProjectCard::color_role_for(const std::string& status) {
    if (status == "active") return "success";
    if (status == "paused") return "warning";
    if (status == "completed") return "info";
    if (status == "cancelled") return "danger";
    return "text_secondary";
}

void ProjectCard::set_status(const std::string& status) {
    status_ = status;
    const std::string role = color_role_for(status);
    status_dot_->set_color_role(role);
    std::string text = status;
    if (!text.empty()) text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    status_label_->set_text(text);
    status_label_->set_color_role(role);
}

void ProjectCard::set_progress(int percent) {
    progress_ = std::max(0, std::min(100, percent));
    bar_->set_value(progress_);
    bar_->set_visible(progress_ > 0);
}

void ProjectCard::set_team_count(int n) {
    team_count_ = std::max(0, n);
    team_label_->set_text(std::to_string(team_count_) + (team_count_ == 1 ? " member" : " members"));
}
