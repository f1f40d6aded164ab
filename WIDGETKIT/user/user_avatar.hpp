#pragma once

#include <SDL.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/widget.hpp"

// Circular avatar: the picture when it can be loaded, otherwise the initials
// on a colour picked from the name. An optional presence dot sits on the
// bottom-right edge.
class UserAvatar : public Widget {
public:
    static constexpr int kPaletteSize = 12;

    explicit UserAvatar(const std::string& name = {}, const std::string& image_path = {}, int size = 48,
                        const std::string& status = {});

    void set_name(const std::string& n) { name_ = n; }
    const std::string& name() const { return name_; }
    void set_image(const std::string& path) { image_path_ = path; }
    const std::string& image_path() const { return image_path_; }
    // online, away, busy, offline; empty hides the dot.
    void set_status(const std::string& s) { status_ = s; }
    const std::string& status() const { return status_; }
    void set_avatar_size(int s) { size_ = s; }
    int avatar_size() const { return size_; }
    // Text drawn instead of the initials, e.g. "+3".
    void set_display_text(const std::string& t) { display_text_ = t; }
    // Neutral look used by counters: light fill, border, text colour.
    void set_neutral(bool n) { neutral_ = n; }

    void set_clickable(bool c) { clickable_ = c; }
    bool is_clickable() const { return clickable_; }
    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }

    std::string initials() const { return initials_for(name_); }
    SDL_Color background_color() const;
    bool has_image() const;
    int status_dot_size() const { return std::max(8, size_ / 6); }

    // First letters of the first and last words, upper-cased; "?" when empty.
    static std::string initials_for(const std::string& name);
    // Palette slot for the name, -1 for an empty name.
    static int palette_index(const std::string& name);
    static SDL_Color palette_color(int index);
    // Unknown statuses use the offline colour.
    static SDL_Color status_color(const std::string& status);

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : size_; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : size_; }
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    SDL_Rect circle_rect() const;

    std::string name_;
    std::string image_path_;
    int size_;
    std::string status_;
    std::string display_text_;
    bool neutral_ = false;
    bool clickable_ = false;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
};

// Row of overlapping avatars; past max_visible a "+N" counter is appended.
class AvatarGroup : public Widget {
public:
    explicit AvatarGroup(int max_visible = 4, int size = 32);

    UserAvatar* add_avatar(const std::string& name, const std::string& image_path = {},
                           const std::string& status = {});
    void clear_avatars();
    size_t avatar_count() const { return avatars_.size(); }
    size_t visible_count() const;
    size_t overflow_count() const;
    // nullptr while everything fits.
    const UserAvatar* overflow_avatar() const { return overflow_count() > 0 ? overflow_.get() : nullptr; }
    UserAvatar* avatar(size_t i) const { return i < avatars_.size() ? avatars_[i].get() : nullptr; }
    int overlap() const { return size_ / 3; }

    int preferred_width() const override;
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : size_; }
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int max_visible_;
    int size_;
    std::vector<std::unique_ptr<UserAvatar>> avatars_;
    std::unique_ptr<UserAvatar> overflow_;
};
