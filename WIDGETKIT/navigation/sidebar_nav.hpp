#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "core/animation.hpp"

// Vertical navigation list grouped in sections. Collapsing it animates the
// width down to the icon column; section titles are hidden while collapsed.
class SidebarNav : public AnimatedWidget {
public:
    static constexpr int kExpandedWidth = 220;
    static constexpr int kCollapsedWidth = 56;
    static constexpr int kHeaderHeight = 48;
    static constexpr int kSectionHeight = 32;
    static constexpr int kItemHeight = 40;
    static constexpr int kIconSize = 20;
    static constexpr Uint32 kCollapseMs = 250;
    static constexpr int kWheelStep = 40;

    explicit SidebarNav(const std::string& title = {}, bool collapsible = true);

    // Sections keep their insertion order. Items added without a section go
    // to an untitled group at the current end of the list.
    void add_section(const std::string& title, bool expanded = true);
    void add_item(const std::string& id, const std::string& text, const std::string& icon = {},
                  const std::string& section = {});
    bool remove_item(const std::string& id);
    bool remove_section(const std::string& title);
    void clear();

    bool has_item(const std::string& id) const;
    std::vector<std::string> item_ids() const;
    std::vector<std::string> sections() const;

    // 0 hides the badge.
    void set_badge(const std::string& id, int count);
    int badge(const std::string& id) const;

    // Highlights the item without emitting item_clicked. Unknown ids are
    // ignored.
    void set_current_item(const std::string& id);
    const std::string& current_item() const { return current_; }

    void set_section_expanded(const std::string& title, bool expanded);
    bool is_section_expanded(const std::string& title) const;

    void set_collapsed(bool collapsed, bool animated = true);
    bool is_collapsed() const { return collapsed_; }
    void toggle_collapsed() { set_collapsed(!collapsed_); }
    // Width this frame, between kCollapsedWidth and kExpandedWidth.
    int current_width() const { return static_cast<int>(width_ + 0.5f); }

    SDL_Rect item_rect(const std::string& id) const;
    SDL_Rect section_rect(const std::string& title) const;
    // Empty when the sidebar is not collapsible.
    SDL_Rect toggle_rect() const;

    void set_on_item_clicked(std::function<void(const std::string&)> cb) { on_item_clicked_ = std::move(cb); }
    void set_on_section_toggled(std::function<void(const std::string&, bool)> cb) { on_section_toggled_ = std::move(cb); }
    void set_on_collapsed_changed(std::function<void(bool)> cb) { on_collapsed_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Item {
        std::string id;
        std::string text;
        std::string icon;
        int badge = 0;
        SDL_Rect rect{0, 0, 0, 0};
    };
    struct Section {
        std::string title;
        bool expanded = true;
        std::vector<Item> items;
        SDL_Rect rect{0, 0, 0, 0};
    };

    Item* find_item(const std::string& id);
    const Item* find_item(const std::string& id) const;
    Section* find_section(const std::string& title);
    const Section* find_section(const std::string& title) const;
    SDL_Rect list_area() const;
    int content_height() const;
    int max_scroll() const;
    bool show_titles() const { return !collapsed_ && !is_animating("width"); }

    std::string title_;
    bool collapsible_;
    bool collapsed_ = false;
    float width_ = static_cast<float>(kExpandedWidth);
    std::vector<Section> sections_;
    std::string current_;
    std::string hovered_id_;
    std::string pressed_id_;
    std::string pressed_section_;
    bool pressed_toggle_ = false;
    int scroll_ = 0;
    std::function<void(const std::string&)> on_item_clicked_{};
    std::function<void(const std::string&, bool)> on_section_toggled_{};
    std::function<void(bool)> on_collapsed_changed_{};
};
