#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/widget.hpp"
#include "style/styles.hpp"

class BaseButton;
class BoxLayout;
class Label;
class ScrollArea;
class UserAvatar;

// Row with an avatar, the name in bold, an optional role and email, and
// action buttons on the right.
class UserListItem : public Widget {
public:
    static constexpr int kAvatarSize = 40;

    explicit UserListItem(const std::string& name = {}, const std::string& role = {},
                          const std::string& email = {}, const std::string& avatar_path = {},
                          const std::string& status = {});
    ~UserListItem() override;

    void set_name(const std::string& name);
    const std::string& name() const { return name_; }
    void set_role(const std::string& role);
    const std::string& role() const { return role_; }
    void set_email(const std::string& email);
    const std::string& email() const { return email_; }
    void set_status(const std::string& status);
    void set_avatar(const std::string& path);
    UserAvatar* avatar() const { return avatar_; }

    // An empty name is derived from the text: "Send Message" -> "send_message".
    BaseButton* add_action(const std::string& text, const std::string& action_name = {},
                           ButtonVariant variant = ButtonVariant::Secondary);
    bool remove_action(const std::string& action_name);
    BaseButton* action_button(const std::string& action_name) const;
    size_t action_count() const { return actions_.size(); }

    void set_clickable(bool c) { clickable_ = c; }
    bool is_clickable() const { return clickable_; }
    void set_selected(bool s) { selected_ = s; }
    bool is_selected() const { return selected_; }
    // Case-insensitive match against name, role and email.
    bool matches(const std::string& query) const;

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }
    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::string name_;
    std::string role_;
    std::string email_;
    std::unique_ptr<BoxLayout> layout_;
    UserAvatar* avatar_ = nullptr;
    Label* name_label_ = nullptr;
    Label* role_label_ = nullptr;
    Label* email_label_ = nullptr;
    BoxLayout* actions_box_ = nullptr;
    std::vector<std::pair<BaseButton*, std::string>> actions_;
    bool clickable_ = true;
    bool selected_ = false;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
    std::function<void(const std::string&)> on_action_clicked_{};
};

// Scrolling list of users with a text filter and single selection.
class UserList : public Widget {
public:
    UserList();
    ~UserList() override;

    UserListItem* add_user(std::unique_ptr<UserListItem> item);
    UserListItem* add_user(const std::string& name, const std::string& role = {}, const std::string& email = {},
                           const std::string& avatar_path = {}, const std::string& status = {});
    bool remove_user(const std::string& name);
    void clear_users();
    UserListItem* find_user(const std::string& name) const;
    std::vector<std::string> users() const;
    int user_count() const { return static_cast<int>(items_.size()); }

    // Hides the users that do not match; empty shows everyone.
    void filter(const std::string& query);
    const std::string& filter_text() const { return filter_; }
    std::vector<std::string> visible_users() const;

    // Selects and emits user_selected; unknown names clear the selection.
    void select_user(const std::string& name);
    // Empty when nothing is selected.
    std::string selected_user() const;

    void set_on_user_selected(std::function<void(const std::string&)> cb) { on_user_selected_ = std::move(cb); }
    void set_on_user_action(std::function<void(const std::string&, const std::string&)> cb) {
        on_user_action_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::unique_ptr<ScrollArea> scroll_;
    BoxLayout* list_ = nullptr;
    std::vector<UserListItem*> items_;
    UserListItem* selected_ = nullptr;
    std::string filter_;
    std::function<void(const std::string&)> on_user_selected_{};
    std::function<void(const std::string&, const std::string&)> on_user_action_{};
};
