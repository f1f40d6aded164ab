#include "pagination.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/layout.hpp"

namespace {
const char* const kLoadMoreText = "Load More";
}

Pagination::Pagination(int total_pages, int current_page, PaginationMode mode)
    : mode_(mode), total_(std::max(1, total_pages)), current_(std::max(1, std::min(current_page, std::max(1, total_pages)))) {
    build();
}

Pagination::~Pagination() = default;

BaseButton* Pagination::make_page_button() {
    auto b = std::make_unique<BaseButton>(std::string{}, ButtonVariant::Ghost, ButtonSize::Small);
    b->set_fixed_size(kPageButtonSize, kPageButtonSize);
    BaseButton* raw = layout_->add_widget(std::move(b));
    raw->set_on_clicked([this, raw]() {
        for (const auto& entry : page_of_) {
            if (entry.first == raw) {
                set_current_page(entry.second);
                return;
            }
        }
    });
    return raw;
}

void Pagination::build() {
    layout_ = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 4);
    layout_->set_parent(this);
    layout_->set_alignment(BoxLayout::Align::Center);
    prev_ = next_ = first_ = last_ = load_ = nullptr;
    left_ellipsis_ = right_ellipsis_ = caption_ = nullptr;
    window_.clear();
    page_of_.clear();

    if (mode_ == PaginationMode::LoadMore) {
        layout_->add_stretch();
        caption_ = layout_->add_widget(std::make_unique<Label>(std::string{}, "default", "text_secondary"));
        load_ = layout_->add_widget(std::make_unique<BaseButton>(kLoadMoreText, ButtonVariant::Primary));
        load_->set_on_clicked([this]() {
            set_loading(true);
            if (on_load_more_) on_load_more_();
        });
        layout_->add_stretch();
        refresh();
        return;
    }

    if (mode_ == PaginationMode::Simple) {
        prev_ = layout_->add_widget(std::make_unique<BaseButton>("\xE2\x86\x90 Previous", ButtonVariant::Secondary));
        layout_->add_stretch();
        caption_ = layout_->add_widget(std::make_unique<Label>(std::string{}, "default", "text_secondary"));
        layout_->add_stretch();
        next_ = layout_->add_widget(std::make_unique<BaseButton>("Next \xE2\x86\x92", ButtonVariant::Secondary));
    } else {
        prev_ = layout_->add_widget(std::make_unique<BaseButton>("\xE2\x80\xB9", ButtonVariant::Ghost, ButtonSize::Small));
        prev_->set_fixed_size(kPageButtonSize, kPageButtonSize);
        first_ = make_page_button();
        left_ellipsis_ = layout_->add_widget(std::make_unique<Label>("...", "default", "text_secondary"));
        // An even max_visible_ centred on the current page spans one extra page.
        const int pool = 2 * (max_visible_ / 2) + 1;
        for (int i = 0; i < pool; ++i) window_.push_back(make_page_button());
        right_ellipsis_ = layout_->add_widget(std::make_unique<Label>("...", "default", "text_secondary"));
        last_ = make_page_button();
        next_ = layout_->add_widget(std::make_unique<BaseButton>("\xE2\x80\xBA", ButtonVariant::Ghost, ButtonSize::Small));
        next_->set_fixed_size(kPageButtonSize, kPageButtonSize);
        layout_->add_spacing(12);
        caption_ = layout_->add_widget(std::make_unique<Label>(std::string{}, "caption", "text_secondary"));
    }
    prev_->set_on_clicked([this]() { previous_page(); });
    next_->set_on_clicked([this]() { next_page(); });
    refresh();
}

std::pair<int, int> Pagination::visible_range() const {
    const int half = max_visible_ / 2;
    int start = std::max(1, current_ - half);
    int end = std::min(total_, current_ + half);
    if (end - start + 1 < max_visible_) {
        if (start == 1) {
            end = std::min(total_, max_visible_);
        } else if (end == total_) {
            start = std::max(1, end - max_visible_ + 1);
        }
    }
    return { start, end };
}

std::vector<int> Pagination::visible_pages() const {
    std::vector<int> out;
    if (total_ <= 1) return out;
    const auto range = visible_range();
    if (range.first > 1) {
        out.push_back(1);
        if (range.first > 2) out.push_back(0);
    }
    for (int p = range.first; p <= range.second; ++p) out.push_back(p);
    if (range.second < total_) {
        if (range.second < total_ - 1) out.push_back(0);
        out.push_back(total_);
    }
    return out;
}

std::string Pagination::page_caption() const {
    return "Page " + std::to_string(current_) + " of " + std::to_string(total_);
}

std::string Pagination::status_text() const {
    if (total_items_ >= 0) {
        return "Showing " + std::to_string(items_shown_) + " of " + std::to_string(total_items_) + " items";
    }
    return "Showing " + std::to_string(items_shown_) + " items";
}

void Pagination::refresh() {
    if (mode_ == PaginationMode::LoadMore) {
        caption_->set_text(status_text());
        const bool all_loaded = total_items_ >= 0 && items_shown_ >= total_items_;
        load_->set_visible(!all_loaded);
        load_->set_loading(loading_);
        return;
    }

    caption_->set_text(page_caption());
    prev_->set_enabled(has_previous());
    next_->set_enabled(has_next());
    if (mode_ == PaginationMode::Simple) return;

    page_of_.clear();
    const bool any = total_ > 1;
    prev_->set_visible(any);
    next_->set_visible(any);
    caption_->set_visible(any);

    auto assign = [this](BaseButton* b, int page) {
        b->set_text(std::to_string(page));
        const bool current = page == current_;
        b->set_variant(current ? ButtonVariant::Primary : ButtonVariant::Ghost);
        b->set_enabled(!current);
        b->show();
        page_of_.emplace_back(b, page);
    };

    const auto range = visible_range();
    first_->hide();
    last_->hide();
    left_ellipsis_->hide();
    right_ellipsis_->hide();
    for (auto* b : window_) b->hide();
    if (!any) return;

    if (range.first > 1) {
        assign(first_, 1);
        left_ellipsis_->set_visible(range.first > 2);
    }
    size_t slot = 0;
    for (int p = range.first; p <= range.second && slot < window_.size(); ++p, ++slot) assign(window_[slot], p);
    if (range.second < total_) {
        right_ellipsis_->set_visible(range.second < total_ - 1);
        assign(last_, total_);
    }
}

void Pagination::set_current_page(int page) {
    if (page < 1 || page > total_ || page == current_) return;
    current_ = page;
    refresh();
    if (on_page_changed_) on_page_changed_(current_);
}

void Pagination::set_total_pages(int total) {
    total_ = std::max(1, total);
    const int clamped = std::min(current_, total_);
    const bool changed = clamped != current_;
    current_ = clamped;
    refresh();
    if (changed && on_page_changed_) on_page_changed_(current_);
}

void Pagination::set_max_visible(int n) {
    n = std::max(1, n);
    if (n == max_visible_) return;
    max_visible_ = n;
    build();
    layout();
}

void Pagination::set_mode(PaginationMode mode) {
    if (mode == mode_) return;
    mode_ = mode;
    build();
    layout();
}

void Pagination::add_items(int count) {
    items_shown_ += std::max(0, count);
    loading_ = false;
    refresh();
}

void Pagination::set_total_items(int total) {
    total_items_ = total < 0 ? -1 : total;
    refresh();
}

void Pagination::set_loading(bool loading) {
    loading_ = loading;
    refresh();
}

void Pagination::reset() {
    items_shown_ = 0;
    loading_ = false;
    refresh();
}

BaseButton* Pagination::page_button(int page) const {
    for (const auto& entry : page_of_) {
        if (entry.second == page) return entry.first;
    }
    return nullptr;
}

int Pagination::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width();
}

int Pagination::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    if (mode_ == PaginationMode::Numeric && total_ <= 1) return 0;
    return layout_->height_for_width(w);
}

void Pagination::layout() { layout_->set_rect(rect_); }

bool Pagination::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void Pagination::update() { layout_->update(); }

void Pagination::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
