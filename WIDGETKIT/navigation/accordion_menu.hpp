#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "core/animation.hpp"

// Menu of titled sections whose item lists slide open under the header.
// Only one section is open at a time unless multiple expansion is allowed.
class AccordionMenu : public AnimatedWidget {
public:
    static constexpr int kHeaderHeight = 44;
    static constexpr int kItemHeight = 36;
    static constexpr int kItemIndent = 32;
    static constexpr Uint32 kAnimMs = 300;

    explicit AccordionMenu(bool allow_multiple = false);

    void add_section(const std::string& title, const std::vector<std::string>& items = {},
                     const std::string& icon = {});
    bool add_item(const std::string& section, const std::string& item);
    bool remove_section(const std::string& title);
    bool remove_item(const std::string& section, const std::string& item);
    void clear_section(const std::string& title);
    void clear();

    std::vector<std::string> sections() const;
    std::vector<std::string> section_items(const std::string& title) const;

    void expand_section(const std::string& title);
    void collapse_section(const std::string& title);
    void toggle_section(const std::string& title);
    void collapse_all();
    bool is_section_expanded(const std::string& title) const;
    // 0 closed, 1 open; in between while animating.
    float section_progress(const std::string& title) const;

    // Turning it off keeps only the first open section.
    void set_allow_multiple(bool allow);
    bool allow_multiple() const { return allow_multiple_; }

    // Highlighted item; clicking an item also makes it active.
    void set_active_item(const std::string& section, const std::string& item);
    const std::string& active_section() const { return active_section_; }
    const std::string& active_item() const { return active_item_; }

    SDL_Rect header_rect(const std::string& title) const;
    // Empty while the item is scrolled out by a closed section.
    SDL_Rect item_rect(const std::string& section, const std::string& item) const;

    void set_on_section_toggled(std::function<void(const std::string&, bool)> cb) { on_section_toggled_ = std::move(cb); }
    void set_on_item_clicked(std::function<void(const std::string&, const std::string&)> cb) { on_item_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Section {
        std::string title;
        std::string icon;
        std::vector<std::string> items;
        bool expanded = false;
        float progress = 0.0f;
        SDL_Rect header{0, 0, 0, 0};
        SDL_Rect body{0, 0, 0, 0};
    };

    Section* find(const std::string& title);
    const Section* find(const std::string& title) const;
    int body_height(const Section& s) const;
    void set_expanded(Section& s, bool expanded);

    bool allow_multiple_;
    std::vector<Section> sections_;
    std::string active_section_;
    std::string active_item_;
    std::string hovered_header_;
    int hovered_item_ = -1;
    std::string hovered_item_section_;
    std::string pressed_header_;
    std::string pressed_section_;
    int pressed_item_ = -1;
    std::function<void(const std::string&, bool)> on_section_toggled_{};
    std::function<void(const std::string&, const std::string&)> on_item_clicked_{};
};
