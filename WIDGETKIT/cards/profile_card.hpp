#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/base_button.hpp"
#include "base/base_card.hpp"

class Label;
class UserAvatar;

// Person card: avatar, name, role, optional e-mail, a row of stats and
// action buttons in the footer.
class ProfileCard : public BaseCard {
public:
    ProfileCard(const std::string& name = {}, const std::string& role = {}, const std::string& avatar_path = {});

    void set_name(const std::string& n);
    const std::string& name() const;
    void set_role(const std::string& r);
    const std::string& role() const;
    void set_email(const std::string& e);
    const std::string& email() const;
    void set_avatar(const std::string& path);
    UserAvatar* avatar() const { return avatar_; }

    // Adds the stat, or updates the value when the label already exists.
    void add_stat(const std::string& label, const std::string& value);
    std::string stat(const std::string& label) const;
    size_t stat_count() const { return stats_.size(); }

    BaseButton* add_action(const std::string& text, std::function<void()> cb = {},
                           ButtonVariant variant = ButtonVariant::Secondary);
    bool remove_action(const std::string& text);
    size_t action_count() const { return actions_.size(); }
    // Runs with the action text after the action's own callback.
    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }

protected:
    ProfileCard(const std::string& name, const std::string& role, const std::string& avatar_path, int avatar_size,
                bool horizontal);

    Label* name_label_ = nullptr;
    Label* role_label_ = nullptr;
    BoxLayout* text_column_ = nullptr;

private:
    void build(const std::string& name, const std::string& role, const std::string& avatar_path, int avatar_size,
               bool horizontal);

    UserAvatar* avatar_ = nullptr;
    Label* email_label_ = nullptr;
    BoxLayout* stats_row_ = nullptr;
    std::vector<std::pair<std::string, Label*>> stats_;
    std::vector<BaseButton*> actions_;
    std::function<void(const std::string&)> on_action_clicked_{};
};

// One-line variant: small avatar with name and role beside it.
class CompactProfileCard : public ProfileCard {
public:
    CompactProfileCard(const std::string& name = {}, const std::string& role = {},
                       const std::string& avatar_path = {});
};

// Compact card with a presence status on the avatar and as text.
class TeamMemberCard : public CompactProfileCard {
public:
    TeamMemberCard(const std::string& name = {}, const std::string& role = {}, const std::string& avatar_path = {},
                   const std::string& status = "online");

    void set_status(const std::string& status);
    const std::string& status() const { return status_; }
    // "Online", "Away"...
    static std::string status_text(const std::string& status);

private:
    std::string status_;
    Label* status_label_ = nullptr;
};
