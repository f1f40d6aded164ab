#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "base/base_button.hpp"
#include "base/base_card.hpp"

class IconButton;
class IconGlyph;
class ImageView;
class Label;
class ProgressBar;
class StatusDot;

// Card whose footer actions fade in while the pointer is over it. The
// footer keeps its space when hidden so the card does not jump.
class HoverActionCard : public BaseCard {
public:
    static constexpr Uint32 kShowMs = 200;
    static constexpr Uint32 kHideMs = 150;

    HoverActionCard(const std::string& title = {}, const std::string& content = {});

    // `name` identifies the action in action_triggered; defaults to the text.
    BaseButton* add_action(const std::string& text, std::function<void()> cb = {}, const std::string& name = {},
                           ButtonVariant variant = ButtonVariant::Secondary);
    bool remove_action(const std::string& name);
    void clear_actions();
    std::vector<std::string> action_names() const;
    BaseButton* action(const std::string& name) const;
    bool actions_shown() const { return actions_shown_; }

    void set_content(const std::string& c);
    const std::string& content() const;

    void set_on_action_triggered(std::function<void(const std::string&)> cb) { on_action_triggered_ = std::move(cb); }

protected:
    void on_hover_changed(bool hovered) override;

    Label* content_ = nullptr;

private:
    void show_actions();
    void hide_actions();

    std::vector<std::pair<std::string, BaseButton*>> actions_;
    bool actions_shown_ = false;
    std::function<void(const std::string&)> on_action_triggered_{};
};

// Launcher tile: a large icon over the title and a short description. The
// whole card is the click target.
class QuickActionCard : public HoverActionCard {
public:
    QuickActionCard(const std::string& title = {}, const std::string& icon = {},
                    const std::string& description = {});

    void set_icon(const std::string& icon);
    const std::string& icon() const;

private:
    IconGlyph* icon_ = nullptr;
};

// Thumbnail with a play/pause toggle and a playback progress bar.
class MediaCard : public HoverActionCard {
public:
    MediaCard(const std::string& title = {}, const std::string& description = {},
              const std::string& thumbnail = {});

    void set_playing(bool playing);
    bool is_playing() const { return playing_; }
    void toggle_playback() { set_playing(!playing_); }
    void set_progress(int percent);
    int progress() const;
    void set_thumbnail(const std::string& path);

    void set_on_playback_changed(std::function<void(bool)> cb) { on_playback_changed_ = std::move(cb); }

private:
    bool playing_ = false;
    ImageView* thumbnail_ = nullptr;
    IconButton* play_ = nullptr;
    ProgressBar* bar_ = nullptr;
    std::function<void(bool)> on_playback_changed_{};
};

// Project summary: status in the header, progress, team size and the
// Open / Edit / Settings actions.
class ProjectCard : public HoverActionCard {
public:
    ProjectCard(const std::string& title = {}, const std::string& description = {},
                const std::string& status = "active", int progress = 0, int team_count = 0);

    void set_status(const std::string& status);
    const std::string& status() const { return status_; }
    // Clamped to [0, 100]; the bar is hidden at 0.
    void set_progress(int percent);
    int progress() const { return progress_; }
    void set_team_count(int n);
    int team_count() const { return team_count_; }

    // active, paused, completed, cancelled
    static std::string color_role_for(const std::string& status);

private:
    std::string status_;
    int progress_ = 0;
    int team_count_ = 0;
    StatusDot* status_dot_ = nullptr;
    Label* status_label_ = nullptr;
    ProgressBar* bar_ = nullptr;
    Label* team_label_ = nullptr;
};
