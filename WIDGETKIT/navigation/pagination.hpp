#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class Label;

enum class PaginationMode { Numeric, Simple, LoadMore };

// Page navigator. Numeric shows a window of page buttons around the current
// page with the first and last pages pinned; Simple shows previous and next
// only; LoadMore counts loaded items behind a "Load More" button.
//
// Pages are 1-based. The button set is built once per mode and only
// relabelled afterwards, so clicks can change the page safely.
class Pagination : public Widget {
public:
    static constexpr int kDefaultMaxVisible = 7;
    static constexpr int kPageButtonSize = 32;

    explicit Pagination(int total_pages = 1, int current_page = 1, PaginationMode mode = PaginationMode::Numeric);
    ~Pagination() override;

    // Out-of-range and unchanged pages are ignored.
    void set_current_page(int page);
    int current_page() const { return current_; }
    // At least 1; the current page is clamped into range.
    void set_total_pages(int total);
    int total_pages() const { return total_; }
    void next_page() { set_current_page(current_ + 1); }
    void previous_page() { set_current_page(current_ - 1); }
    bool has_previous() const { return current_ > 1; }
    bool has_next() const { return current_ < total_; }

    void set_max_visible(int n);
    int max_visible() const { return max_visible_; }
    void set_mode(PaginationMode mode);
    PaginationMode mode() const { return mode_; }

    // Numeric entries left to right; 0 marks an ellipsis. Empty when there is
    // at most one page.
    std::vector<int> visible_pages() const;
    // First and last page of the sliding window.
    std::pair<int, int> visible_range() const;
    std::string page_caption() const;

    // Load-more state.
    void add_items(int count);
    // -1 when unknown.
    void set_total_items(int total);
    int total_items() const { return total_items_; }
    int items_shown() const { return items_shown_; }
    void set_loading(bool loading);
    bool is_loading() const { return loading_; }
    void reset();
    std::string status_text() const;

    BaseButton* previous_button() const { return prev_; }
    BaseButton* next_button() const { return next_; }
    BaseButton* load_more_button() const { return load_; }
    // Button showing `page`, or nullptr when it is not on screen.
    BaseButton* page_button(int page) const;

    void set_on_page_changed(std::function<void(int)> cb) { on_page_changed_ = std::move(cb); }
    void set_on_load_more_requested(std::function<void()> cb) { on_load_more_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void build();
    void refresh();
    BaseButton* make_page_button();

    PaginationMode mode_;
    int total_;
    int current_;
    int max_visible_ = kDefaultMaxVisible;
    int total_items_ = -1;
    int items_shown_ = 0;
    bool loading_ = false;

    std::unique_ptr<BoxLayout> layout_;
    BaseButton* prev_ = nullptr;
    BaseButton* next_ = nullptr;
    BaseButton* first_ = nullptr;
    BaseButton* last_ = nullptr;
    Label* left_ellipsis_ = nullptr;
    Label* right_ellipsis_ = nullptr;
    std::vector<BaseButton*> window_;
    std::vector<std::pair<BaseButton*, int>> page_of_;
    Label* caption_ = nullptr;
    BaseButton* load_ = nullptr;
    std::function<void(int)> on_page_changed_{};
    std::function<void()> on_load_more_{};
};
