#include "profile_card.hpp"

#include <algorithm>

#include "base/controls.hpp"
#include "user/user_avatar.hpp"

namespace {
constexpr int kAvatarSize = 80;
constexpr int kCompactAvatarSize = 40;
constexpr int kStatGap = 24;
}

ProfileCard::ProfileCard(const std::string& name, const std::string& role, const std::string& avatar_path) {
    build(name, role, avatar_path, kAvatarSize, false);
}

ProfileCard::ProfileCard(const std::string& name, const std::string& role, const std::string& avatar_path,
                         int avatar_size, bool horizontal) {
    build(name, role, avatar_path, avatar_size, horizontal);
}

void ProfileCard::build(const std::string& name, const std::string& role, const std::string& avatar_path,
                        int avatar_size, bool horizontal) {
    auto name_label = std::make_unique<Label>(name, horizontal ? "default" : "heading");
    name_label->set_bold(true);
    auto role_label = std::make_unique<Label>(role, horizontal ? "caption" : "default", "text_secondary");
    auto email_label = std::make_unique<Label>(std::string(), "caption", "text_secondary");
    auto avatar = std::make_unique<UserAvatar>(name, avatar_path, avatar_size);

    if (horizontal) {
        auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12);
        auto column = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2);
        avatar_ = row->add_widget(std::move(avatar));
        name_label_ = column->add_widget(std::move(name_label));
        role_label_ = column->add_widget(std::move(role_label));
        email_label_ = column->add_widget(std::move(email_label));
        text_column_ = row->add_widget(std::move(column), 1);
        body_->add(std::move(row));
        body_->set_margins(12);
    } else {
        body_->set_alignment(BoxLayout::Align::Center);
        body_->set_spacing(Spacing::label_gap());
        avatar_ = body_->add_widget(std::move(avatar));
        body_->add_spacing(Spacing::item_gap());
        name_label_ = body_->add_widget(std::move(name_label));
        role_label_ = body_->add_widget(std::move(role_label));
        email_label_ = body_->add_widget(std::move(email_label));
        text_column_ = body_.get();
    }
    email_label_->hide();

    auto stats = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, kStatGap);
    stats_row_ = body_->add_widget(std::move(stats));
    stats_row_->hide();
}

void ProfileCard::set_name(const std::string& n) {
    name_label_->set_text(n);
    avatar_->set_name(n);
}

const std::string& ProfileCard::name() const {
    return name_label_->text();
}

void ProfileCard::set_role(const std::string& r) {
    role_label_->set_text(r);
}

const std::string& ProfileCard::role() const {
    return role_label_->text();
}

void ProfileCard::set_email(const std::string& e) {
    email_label_->set_text(e);
    email_label_->set_visible(!e.empty());
}

const std::string& ProfileCard::email() const {
    return email_label_->text();
}

void ProfileCard::set_avatar(const std::string& path) {
    avatar_->set_image(path);
}

void ProfileCard::add_stat(const std::string& label, const std::string& value) {
    for (auto& s : stats_) {
        if (s.first == label) {
            s.second->set_text(value);
            return;
        }
    }
    auto column = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    column->set_alignment(BoxLayout::Align::Center);
    auto value_label = std::make_unique<Label>(value, "heading");
    value_label->set_bold(true);
    Label* raw = column->add_widget(std::move(value_label));
    column->add(std::make_unique<Label>(label, "caption", "text_secondary"));
    stats_row_->add(std::move(column));
    stats_row_->show();
    stats_.emplace_back(label, raw);
}

std::string ProfileCard::stat(const std::string& label) const {
    for (const auto& s : stats_) {
        if (s.first == label) return s.second->text();
    }
    return std::string();
}

BaseButton* ProfileCard::add_action(const std::string& text, std::function<void()> cb, ButtonVariant variant) {
    auto button = std::make_unique<BaseButton>(text, variant, ButtonSize::Small);
    button->set_on_clicked([this, text, cb]() {
        if (cb) cb();
        if (on_action_clicked_) on_action_clicked_(text);
    });
    BaseButton* raw = static_cast<BaseButton*>(add_footer_widget(std::move(button)));
    actions_.push_back(raw);
    return raw;
}

bool ProfileCard::remove_action(const std::string& text) {
    auto it = std::find_if(actions_.begin(), actions_.end(), [&](BaseButton* b) { return b->text() == text; });
    if (it == actions_.end()) return false;
    footer_->remove(*it);
    actions_.erase(it);
    if (actions_.empty()) footer_->hide();
    return true;
}

CompactProfileCard::CompactProfileCard(const std::string& name, const std::string& role,
                                       const std::string& avatar_path)
    : ProfileCard(name, role, avatar_path, kCompactAvatarSize, true) {}

TeamMemberCard::TeamMemberCard(const std::string& name, const std::string& role, const std::string& avatar_path,
                               const std::string& status)
    : CompactProfileCard(name, role, avatar_path) {
    status_label_ = text_column_->add_widget(std::make_unique<Label>(std::string(), "caption"));
    set_status(status);
}

std::string TeamMemberCard::status_text(const std::string& status) {
    if (status == "online") return "Online";
    if (status == "away") return "Away";
    if (status == "busy") return "Busy";
    return "Offline";
}

void TeamMemberCard::set_status(const std::string& status) {
    status_ = status;
    avatar()->set_status(status);
    status_label_->set_text(status_text(status));
    status_label_->set_color(UserAvatar::status_color(status));
}
