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
class UserAvatar;

// Profile page header: a cover band (gradient or banner image), an avatar
// overlapping its lower edge, name, title, location, bio, a row of stats and
// action buttons.
class ProfileHeader : public Widget {
public:
    static constexpr int kBannerHeight = 200;
    static constexpr int kCompactBannerHeight = 100;
    static constexpr int kAvatarSize = 80;
    static constexpr int kCompactAvatarSize = 60;

    explicit ProfileHeader(const std::string& name = {}, const std::string& title = {},
                           const std::string& avatar_path = {}, const std::string& bio = {},
                           const std::string& location = {});
    ~ProfileHeader() override;

    void set_name(const std::string& name);
    const std::string& name() const { return name_; }
    void set_title(const std::string& title);
    const std::string& title() const { return title_; }
    void set_bio(const std::string& bio);
    const std::string& bio() const { return bio_; }
    void set_location(const std::string& location);
    const std::string& location() const { return location_; }
    void set_avatar(const std::string& path);
    // Image drawn over the cover band; empty restores the gradient.
    void set_banner(const std::string& path) { banner_path_ = path; }
    const std::string& banner() const { return banner_path_; }
    // Smaller cover band and avatar.
    void set_compact(bool compact);
    bool is_compact() const { return compact_; }

    // Updates the value when the label already exists.
    void add_stat(const std::string& label, const std::string& value);
    void add_stat(const std::string& label, long long value) { add_stat(label, std::to_string(value)); }
    std::string stat(const std::string& label) const;
    std::vector<std::pair<std::string, std::string>> stats() const;

    // An empty name is derived from the text: "Send Message" -> "send_message".
    BaseButton* add_action(const std::string& text, const std::string& action_name = {},
                           ButtonVariant variant = ButtonVariant::Primary);
    bool remove_action(const std::string& action_name);
    BaseButton* action_button(const std::string& action_name) const;
    size_t action_count() const { return actions_.size(); }

    // Shows the "Edit Profile" button.
    void set_editable(bool editable);
    bool is_editable() const { return editable_; }
    BaseButton* edit_button() const { return edit_button_; }
    UserAvatar* avatar() const { return avatar_.get(); }

    SDL_Rect banner_rect() const;
    SDL_Rect avatar_rect() const;

    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }
    void set_on_avatar_clicked(std::function<void()> cb) { on_avatar_clicked_ = std::move(cb); }
    void set_on_banner_clicked(std::function<void()> cb) { on_banner_clicked_ = std::move(cb); }
    void set_on_edit_clicked(std::function<void()> cb) { on_edit_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int banner_height() const { return compact_ ? kCompactBannerHeight : kBannerHeight; }
    int avatar_size() const { return compact_ ? kCompactAvatarSize : kAvatarSize; }
    void apply_metrics();

    std::string name_;
    std::string title_;
    std::string bio_;
    std::string location_;
    std::string banner_path_;
    bool compact_ = false;
    bool editable_ = false;
    std::unique_ptr<UserAvatar> avatar_;
    std::unique_ptr<BoxLayout> info_;
    BoxLayout* top_row_ = nullptr;
    Label* name_label_ = nullptr;
    Label* title_label_ = nullptr;
    Label* location_label_ = nullptr;
    Label* bio_label_ = nullptr;
    BoxLayout* actions_box_ = nullptr;
    BaseButton* edit_button_ = nullptr;
    BoxLayout* stats_row_ = nullptr;
    std::vector<std::pair<std::string, Label*>> stats_;
    std::vector<std::pair<BaseButton*, std::string>> actions_;
    ClickTracker banner_click_;
    std::function<void(const std::string&)> on_action_clicked_{};
    std::function<void()> on_avatar_clicked_{};
    std::function<void()> on_banner_clicked_{};
    std::function<void()> on_edit_clicked_{};
};
