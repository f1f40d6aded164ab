#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/animation.hpp"

class BoxLayout;
class StackedLayout;

// Row (or column) of tabs with an indicator that slides to the current tab.
// Clicking a close button only reports tab_close_requested; the owner decides
// whether the tab goes away.
class TabBar : public AnimatedWidget {
public:
    enum class Orientation { Horizontal, Vertical };

    static constexpr int kTabHeight = 40;
    static constexpr int kMinTabWidth = 80;
    static constexpr int kVerticalWidth = 180;
    static constexpr int kCloseSize = 16;
    static constexpr int kIconSize = 16;
    static constexpr int kIndicatorThickness = 3;
    static constexpr int kAddButtonSize = 32;
    static constexpr Uint32 kIndicatorMs = 200;
    static constexpr int kWheelStep = 40;

    explicit TabBar(Orientation orientation = Orientation::Horizontal);

    // Returns the new index. The first tab becomes current.
    int add_tab(const std::string& text, bool closable = true, const std::string& icon = {});
    bool remove_tab(int index);
    void clear();

    int count() const { return static_cast<int>(tabs_.size()); }
    int current_index() const { return current_; }
    // Out-of-range and unchanged indices are ignored.
    void set_current_index(int index);

    std::string tab_text(int index) const;
    void set_tab_text(int index, const std::string& text);
    std::string tab_icon(int index) const;
    void set_tab_icon(int index, const std::string& icon);
    bool is_tab_closable(int index) const;
    void set_tab_closable(int index, bool closable);

    // Shows a "+" button after the tabs. Without an add_requested handler it
    // appends "Tab N" and selects it.
    void set_add_button_visible(bool v);
    bool is_add_button_visible() const { return show_add_; }

    Orientation orientation() const { return orientation_; }

    SDL_Rect tab_rect(int index) const;
    // Empty for tabs that cannot be closed.
    SDL_Rect close_rect(int index) const;
    SDL_Rect add_button_rect() const;
    // Where the indicator is drawn this frame.
    SDL_Rect indicator_rect() const;
    int scroll_offset() const { return scroll_; }

    void set_on_current_changed(std::function<void(int)> cb) { on_current_changed_ = std::move(cb); }
    void set_on_tab_close_requested(std::function<void(int)> cb) { on_close_requested_ = std::move(cb); }
    void set_on_add_requested(std::function<void()> cb) { on_add_requested_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Tab {
        std::string text;
        std::string icon;
        bool closable = true;
        SDL_Rect rect{0, 0, 0, 0};
    };

    int tab_extent(const Tab& t) const;
    int content_extent() const;
    SDL_Rect tabs_area() const;
    int max_scroll() const;
    void ensure_visible(int index);
    SDL_Rect target_indicator(int index) const;
    void slide_indicator(const SDL_Rect& from);
    int tab_at(SDL_Point p) const;

    Orientation orientation_;
    std::vector<Tab> tabs_;
    int current_ = -1;
    int scroll_ = 0;
    bool show_add_ = false;
    int hovered_tab_ = -1;
    int hovered_close_ = -1;
    int pressed_close_ = -1;
    bool pressed_add_ = false;
    SDL_Rect indicator_from_{0, 0, 0, 0};
    float indicator_t_ = 1.0f;
    std::function<void(int)> on_current_changed_{};
    std::function<void(int)> on_close_requested_{};
    std::function<void()> on_add_requested_{};
};

// Tab bar laid out top to bottom with the indicator on the left edge.
class VerticalTabBar : public TabBar {
public:
    VerticalTabBar() : TabBar(Orientation::Vertical) {}
};

// Tab bar over a stack of pages. Closing a tab removes its page.
class TabContainer : public Widget {
public:
    explicit TabContainer(TabBar::Orientation orientation = TabBar::Orientation::Horizontal);
    ~TabContainer() override;

    int add_tab(const std::string& text, std::unique_ptr<Widget> page, bool closable = true,
                const std::string& icon = {});
    template <class T>
    T* add_page(const std::string& text, std::unique_ptr<T> page, bool closable = true) {
        T* raw = page.get();
        add_tab(text, std::move(page), closable);
        return raw;
    }
    bool remove_tab(int index);
    void clear();

    int count() const;
    int current_index() const;
    void set_current_index(int index);
    Widget* page(int index) const;
    Widget* current_page() const;
    TabBar& tab_bar() { return *bar_; }
    const TabBar& tab_bar() const { return *bar_; }

    void set_on_current_changed(std::function<void(int)> cb) { on_current_changed_ = std::move(cb); }
    void set_on_tab_closed(std::function<void(int, const std::string&)> cb) { on_tab_closed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::unique_ptr<BoxLayout> layout_;
    TabBar* bar_ = nullptr;
    StackedLayout* stack_ = nullptr;
    std::function<void(int)> on_current_changed_{};
    std::function<void(int, const std::string&)> on_tab_closed_{};
};
