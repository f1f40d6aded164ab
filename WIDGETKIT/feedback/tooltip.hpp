#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "base/base_popup.hpp"
#include "core/clock.hpp"

class BaseButton;
class IconGlyph;
class Label;

enum class TooltipSide { Top, Bottom, Left, Right };

// Small dark popup with text, an optional icon and optional action buttons.
// Passive: it never takes the pointer away from the page.
class Tooltip : public BasePopup {
public:
    static constexpr int kMaxWidth = 300;
    static constexpr int kGap = 6;
    static constexpr Uint32 kDefaultDelay = 500;

    explicit Tooltip(const std::string& text = {}, const std::string& icon = {}, Uint32 delay = kDefaultDelay);

    void set_text(const std::string& t);
    const std::string& text() const;
    void set_icon(const std::string& icon);
    const std::string& icon() const;
    void set_delay(Uint32 ms) { delay_ = ms; }
    Uint32 delay() const { return delay_; }

    BaseButton* add_action(const std::string& text, const std::string& name = {});

    // Places the tooltip beside `target`; flips to the other side when it
    // would leave the screen.
    void show_for(const SDL_Rect& target, TooltipSide side = TooltipSide::Top);
    void show_tooltip_at(int x, int y) { show_at_position(x, y); }
    // Called when the pointer leaves the widget the tooltip belongs to.
    virtual void target_left() { close_animated(); }

    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }

    int preferred_width() const override;
    void render(SDL_Renderer* r) const override;

protected:
    SDL_Color background() const;

    std::string background_role_ = "dark";
    BoxLayout* header_ = nullptr;
    IconGlyph* icon_ = nullptr;
    Label* text_ = nullptr;
    BoxLayout* actions_ = nullptr;

private:
    Uint32 delay_;
    std::function<void(const std::string&)> on_action_clicked_{};
};

// Tooltip built from a title, description lines, a shortcut hint and
// separators.
class RichTooltip : public Tooltip {
public:
    RichTooltip(const std::string& title = {}, const std::string& body = {});

    Label* add_title(const std::string& title);
    Label* add_description(const std::string& description);
    // "Shortcut: Ctrl+S"
    Label* add_shortcut(const std::string& shortcut);
    void add_separator();
};

// Rich tooltip headed by a question-mark icon.
class HelpTooltip : public RichTooltip {
public:
    HelpTooltip(const std::string& title, const std::string& description, const std::string& shortcut = {});
};

// Short-delay tooltip coloured by status: success, error, warning, info,
// loading.
class StatusTooltip : public Tooltip {
public:
    static constexpr Uint32 kDelay = 200;

    explicit StatusTooltip(const std::string& status, const std::string& details = {});

    void set_status(const std::string& status);
    const std::string& status() const { return status_; }

    static std::string icon_for(const std::string& status);
    static std::string color_role_for(const std::string& status);

private:
    std::string status_;
};

// Tooltip with a close cross that stays open while the pointer is over it,
// so its actions can be clicked. It closes shortly after the pointer has
// left both the target and the tooltip.
class InteractiveTooltip : public Tooltip {
public:
    static constexpr Uint32 kHideDelay = 300;

    explicit InteractiveTooltip(const std::string& text = {});

    void target_left() override;
    bool hide_pending() const { return hide_timer_.is_active(); }

    void update() override;

protected:
    void on_hover_changed(bool hovered) override;

private:
    Timer hide_timer_{ true };
};

// Shows tooltips for registered widgets after the pointer rests on them for
// the delay. Feed it every event (it never consumes them) and call update()
// once per frame. Widgets must be unregistered before they are destroyed.
class TooltipManager {
public:
    TooltipManager();
    TooltipManager(const TooltipManager&) = delete;
    TooltipManager& operator=(const TooltipManager&) = delete;

    void register_widget(Widget* w, const std::string& text, const std::string& icon = {});
    // Uses a tooltip of the caller's own making for this widget.
    void register_widget(Widget* w, std::unique_ptr<Tooltip> tooltip);
    void unregister_widget(Widget* w);
    bool is_registered(const Widget* w) const;
    size_t count() const { return entries_.size(); }

    void set_delay(Uint32 ms) { delay_ = ms; }
    Uint32 delay() const { return delay_; }
    void set_side(TooltipSide s) { side_ = s; }

    void handle_event(const SDL_Event& e);
    void update();
    void hide();

    Widget* hovered_widget() const { return hover_; }
    Tooltip* current_tooltip() const { return current_; }
    bool is_showing() const { return current_ && current_->is_visible(); }

private:
    struct Entry {
        Widget* widget = nullptr;
        std::string text;
        std::string icon;
        std::unique_ptr<Tooltip> custom;
    };

    Entry* find(const Widget* w);
    Entry* entry_at(SDL_Point p);
    void show_for(Entry& e);

    std::vector<Entry> entries_;
    Tooltip shared_;
    Tooltip* current_ = nullptr;
    Widget* hover_ = nullptr;
    Timer show_timer_{ true };
    Uint32 delay_ = Tooltip::kDefaultDelay;
    TooltipSide side_ = TooltipSide::Top;
};

// Question-mark glyph that shows a HelpTooltip while hovered.
class HelpIcon : public Widget {
public:
    HelpIcon(const std::string& title, const std::string& description, int size = 16);

    HelpTooltip* help_tooltip() const { return help_tooltip_.get(); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : size_; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : size_; }
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void on_hover_changed(bool hovered) override;

private:
    int size_;
    std::unique_ptr<HelpTooltip> help_tooltip_;
    Timer show_timer_{ true };
};
