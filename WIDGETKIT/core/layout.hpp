#pragma once

#include <SDL.h>
#include <memory>
#include <vector>

#include "widget.hpp"

// Stacks owned children vertically or horizontally. Hidden children take no
// space; spare room goes to children with a stretch factor.
class BoxLayout : public Widget {
public:
    enum class Direction { Vertical, Horizontal };
    enum class Align { Start, Center, End, Fill };

    explicit BoxLayout(Direction dir = Direction::Vertical, int spacing = -1);

    Widget* add(std::unique_ptr<Widget> w, int stretch = 0);
    template <class T>
    T* add_widget(std::unique_ptr<T> w, int stretch = 0) {
        T* raw = w.get();
        add(std::move(w), stretch);
        return raw;
    }
    Widget* insert(size_t index, std::unique_ptr<Widget> w, int stretch = 0);
    void add_spacing(int px);
    void add_stretch(int stretch = 1);
    std::unique_ptr<Widget> take(Widget* w);
    bool remove(Widget* w);
    void clear();

    size_t count() const;
    Widget* at(size_t index) const;
    int index_of(const Widget* w) const;

    void set_margins(int left, int top, int right, int bottom);
    void set_margins(int all) { set_margins(all, all, all, all); }
    void set_spacing(int s) { spacing_ = s; }
    int spacing() const;
    void set_alignment(Align a) { align_ = a; }
    Direction direction() const { return dir_; }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Item {
        std::unique_ptr<Widget> widget;
        int stretch = 0;
        int space = 0;
    };
    bool item_visible(const Item& it) const;
    std::vector<int> horizontal_widths(int inner_w) const;

    Direction dir_;
    Align align_;
    int spacing_ = -1;
    int margin_l_ = 0;
    int margin_t_ = 0;
    int margin_r_ = 0;
    int margin_b_ = 0;
    std::vector<Item> items_;
};

// Clipped viewport over a single content widget, scrolled with the wheel.
class ScrollArea : public Widget {
public:
    static constexpr int kWheelStep = 40;
    static constexpr int kScrollbarWidth = 6;

    explicit ScrollArea(std::unique_ptr<Widget> content = nullptr);

    void set_content(std::unique_ptr<Widget> content);
    Widget* content() const { return content_.get(); }

    int scroll() const { return scroll_; }
    void set_scroll(int y);
    int max_scroll() const { return max_scroll_; }
    int content_height() const { return content_h_; }
    void scroll_to_top() { set_scroll(0); }
    void scroll_to_bottom();
    // `area` in screen coordinates.
    void ensure_visible(const SDL_Rect& area);
    // Keep the view pinned to the bottom while content grows.
    void set_follow_bottom(bool f) { follow_bottom_ = f; }
    // Upper bound for height_for_width when no fixed height is set.
    void set_max_height(int h) { max_height_ = h; }

    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    SDL_Rect viewport() const { return rect_; }

    std::unique_ptr<Widget> content_;
    int scroll_ = 0;
    int max_scroll_ = 0;
    int content_h_ = 0;
    int max_height_ = -1;
    bool follow_bottom_ = false;
};

// Pages stacked on top of each other; only the current one is laid out,
// updated and drawn.
class StackedLayout : public Widget {
public:
    StackedLayout() = default;

    // Returns the index of the new page. The first page becomes current.
    int add(std::unique_ptr<Widget> page);
    std::unique_ptr<Widget> take(int index);
    bool remove(int index) { return take(index) != nullptr; }
    void clear();
    int count() const { return static_cast<int>(pages_.size()); }
    Widget* at(int index) const;
    int index_of(const Widget* page) const;

    // Out-of-range indices are ignored.
    void set_current(int index);
    int current() const { return current_; }
    Widget* current_page() const { return at(current_); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::vector<std::unique_ptr<Widget>> pages_;
    int current_ = -1;
};
