#include "layout.hpp"

#include <algorithm>

#include "draw_utils.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

BoxLayout::BoxLayout(Direction dir, int spacing)
    : dir_(dir),
      align_(dir == Direction::Vertical ? Align::Fill : Align::Center),
      spacing_(spacing) {}

Widget* BoxLayout::add(std::unique_ptr<Widget> w, int stretch) {
    return insert(items_.size(), std::move(w), stretch);
}

Widget* BoxLayout::insert(size_t index, std::unique_ptr<Widget> w, int stretch) {
    if (!w) return nullptr;
    Widget* raw = w.get();
    raw->set_parent(this);
    Item it;
    it.widget = std::move(w);
    it.stretch = std::max(0, stretch);
    // Translate the widget index into an item index (spacers are skipped).
    size_t pos = items_.size();
    size_t seen = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        if (!items_[i].widget) continue;
        if (seen == index) { pos = i; break; }
        ++seen;
    }
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(it));
    layout();
    return raw;
}

void BoxLayout::add_spacing(int px) {
    Item it;
    it.space = std::max(0, px);
    items_.push_back(std::move(it));
}

void BoxLayout::add_stretch(int stretch) {
    Item it;
    it.stretch = std::max(1, stretch);
    items_.push_back(std::move(it));
}

std::unique_ptr<Widget> BoxLayout::take(Widget* w) {
    for (auto it = items_.begin(); it != items_.end(); ++it) {
        if (it->widget.get() == w) {
            std::unique_ptr<Widget> out = std::move(it->widget);
            items_.erase(it);
            out->set_parent(nullptr);
            layout();
            return out;
        }
    }
    return nullptr;
}

bool BoxLayout::remove(Widget* w) {
    return take(w) != nullptr;
}

void BoxLayout::clear() {
    items_.clear();
}

size_t BoxLayout::count() const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
                                             [](const Item& it) { return it.widget != nullptr; }));
}

Widget* BoxLayout::at(size_t index) const {
    size_t seen = 0;
    for (const auto& it : items_) {
        if (!it.widget) continue;
        if (seen == index) return it.widget.get();
        ++seen;
    }
    return nullptr;
}

int BoxLayout::index_of(const Widget* w) const {
    int seen = 0;
    for (const auto& it : items_) {
        if (!it.widget) continue;
        if (it.widget.get() == w) return seen;
        ++seen;
    }
    return -1;
}

void BoxLayout::set_margins(int left, int top, int right, int bottom) {
    margin_l_ = std::max(0, left);
    margin_t_ = std::max(0, top);
    margin_r_ = std::max(0, right);
    margin_b_ = std::max(0, bottom);
}

int BoxLayout::spacing() const {
    return spacing_ >= 0 ? spacing_ : Spacing::item_gap();
}

bool BoxLayout::item_visible(const Item& it) const {
    return !it.widget || it.widget->is_visible();
}

std::vector<int> BoxLayout::horizontal_widths(int inner_w) const {
    std::vector<int> widths(items_.size(), 0);
    int used = 0;
    int total_stretch = 0;
    int n = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        const Item& it = items_[i];
        if (!item_visible(it)) continue;
        ++n;
        widths[i] = it.widget ? std::max(0, it.widget->preferred_width()) : it.space;
        used += widths[i];
        total_stretch += it.stretch;
    }
    if (n > 1) used += spacing() * (n - 1);
    int leftover = inner_w - used;
    if (leftover > 0 && total_stretch > 0) {
        int given = 0;
        int last = -1;
        for (size_t i = 0; i < items_.size(); ++i) {
            if (!item_visible(items_[i]) || items_[i].stretch == 0) continue;
            int extra = leftover * items_[i].stretch / total_stretch;
            widths[i] += extra;
            given += extra;
            last = static_cast<int>(i);
        }
        if (last >= 0) widths[static_cast<size_t>(last)] += leftover - given;
    } else if (leftover < 0) {
        for (size_t i = items_.size(); i-- > 0 && leftover < 0;) {
            if (!item_visible(items_[i]) || items_[i].stretch == 0) continue;
            const int cut = std::min(widths[i], -leftover);
            widths[i] -= cut;
            leftover += cut;
        }
    }
    return widths;
}

int BoxLayout::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    int total = 0;
    int n = 0;
    for (const auto& it : items_) {
        if (!item_visible(it)) continue;
        const int w = it.widget ? it.widget->preferred_width() : it.space;
        if (dir_ == Direction::Horizontal) total += w;
        else total = std::max(total, w);
        ++n;
    }
    if (dir_ == Direction::Horizontal && n > 1) total += spacing() * (n - 1);
    return total + margin_l_ + margin_r_;
}

int BoxLayout::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int inner_w = std::max(0, w - margin_l_ - margin_r_);
    int total = 0;
    if (dir_ == Direction::Vertical) {
        int n = 0;
        for (const auto& it : items_) {
            if (!item_visible(it)) continue;
            total += it.widget ? it.widget->height_for_width(inner_w) : it.space;
            ++n;
        }
        if (n > 1) total += spacing() * (n - 1);
    } else {
        const auto widths = horizontal_widths(inner_w);
        for (size_t i = 0; i < items_.size(); ++i) {
            if (!items_[i].widget || !item_visible(items_[i])) continue;
            total = std::max(total, items_[i].widget->height_for_width(widths[i]));
        }
    }
    return total + margin_t_ + margin_b_;
}

void BoxLayout::layout() {
    const int inner_x = rect_.x + margin_l_;
    const int inner_y = rect_.y + margin_t_;
    const int inner_w = std::max(0, rect_.w - margin_l_ - margin_r_);
    const int inner_h = std::max(0, rect_.h - margin_t_ - margin_b_);
    const int gap = spacing();

    if (dir_ == Direction::Vertical) {
        std::vector<int> heights(items_.size(), 0);
        int used = 0;
        int total_stretch = 0;
        int n = 0;
        for (size_t i = 0; i < items_.size(); ++i) {
            if (!item_visible(items_[i])) continue;
            heights[i] = items_[i].widget ? items_[i].widget->height_for_width(inner_w) : items_[i].space;
            used += heights[i];
            total_stretch += items_[i].stretch;
            ++n;
        }
        if (n > 1) used += gap * (n - 1);
        const int leftover = inner_h - used;
        if (leftover > 0 && total_stretch > 0) {
            for (size_t i = 0; i < items_.size(); ++i) {
                if (!item_visible(items_[i]) || items_[i].stretch == 0) continue;
                heights[i] += leftover * items_[i].stretch / total_stretch;
            }
        }
        int y = inner_y;
        for (size_t i = 0; i < items_.size(); ++i) {
            if (!item_visible(items_[i])) continue;
            if (Widget* w = items_[i].widget.get()) {
                int cw = inner_w;
                int cx = inner_x;
                if (align_ != Align::Fill) {
                    cw = std::min(inner_w, std::max(0, w->preferred_width()));
                    if (align_ == Align::Center) cx = inner_x + (inner_w - cw) / 2;
                    else if (align_ == Align::End) cx = inner_x + inner_w - cw;
                }
                w->set_rect(SDL_Rect{ cx, y, cw, heights[i] });
            }
            y += heights[i] + gap;
        }
        return;
    }

    const auto widths = horizontal_widths(inner_w);
    int x = inner_x;
    for (size_t i = 0; i < items_.size(); ++i) {
        if (!item_visible(items_[i])) continue;
        if (Widget* w = items_[i].widget.get()) {
            int ch = inner_h;
            int cy = inner_y;
            if (align_ != Align::Fill) {
                ch = std::min(inner_h, w->height_for_width(widths[i]));
                if (align_ == Align::Center) cy = inner_y + (inner_h - ch) / 2;
                else if (align_ == Align::End) cy = inner_y + inner_h - ch;
            }
            w->set_rect(SDL_Rect{ x, cy, widths[i], ch });
        }
        x += widths[i] + gap;
    }
}

bool BoxLayout::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    for (auto& it : items_) {
        if (it.widget && it.widget->is_visible() && it.widget->handle_event(e)) {
            return true;
        }
    }
    return false;
}

void BoxLayout::update() {
    if (!visible_) return;
    layout();
    for (auto& it : items_) {
        if (it.widget && it.widget->is_visible()) it.widget->update();
    }
}

void BoxLayout::render(SDL_Renderer* r) const {
    if (!visible_) return;
    for (const auto& it : items_) {
        if (it.widget && it.widget->is_visible()) it.widget->render(r);
    }
}

ScrollArea::ScrollArea(std::unique_ptr<Widget> content) {
    set_content(std::move(content));
}

void ScrollArea::set_content(std::unique_ptr<Widget> content) {
    content_ = std::move(content);
    if (content_) content_->set_parent(this);
    scroll_ = 0;
    layout();
}

void ScrollArea::set_scroll(int y) {
    scroll_ = std::max(0, std::min(max_scroll_, y));
    layout();
}

void ScrollArea::scroll_to_bottom() {
    layout();
    set_scroll(max_scroll_);
}

void ScrollArea::ensure_visible(const SDL_Rect& area) {
    const int top = area.y - rect_.y;
    const int bottom = top + area.h;
    if (top < 0) {
        set_scroll(scroll_ + top);
    } else if (bottom > rect_.h) {
        set_scroll(scroll_ + (bottom - rect_.h));
    }
}

int ScrollArea::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int ch = content_ ? content_->height_for_width(w) : 0;
    return max_height_ >= 0 ? std::min(ch, max_height_) : ch;
}

void ScrollArea::layout() {
    if (!content_) {
        content_h_ = 0;
        max_scroll_ = 0;
        scroll_ = 0;
        return;
    }
    int w = rect_.w;
    content_h_ = content_->height_for_width(w);
    if (content_h_ > rect_.h) {
        w = std::max(0, rect_.w - kScrollbarWidth - 2);
        content_h_ = content_->height_for_width(w);
    }
    const bool was_at_bottom = scroll_ >= max_scroll_;
    max_scroll_ = std::max(0, content_h_ - rect_.h);
    if (follow_bottom_ && was_at_bottom) scroll_ = max_scroll_;
    scroll_ = std::max(0, std::min(max_scroll_, scroll_));
    content_->set_rect(SDL_Rect{ rect_.x, rect_.y - scroll_, w, content_h_ });
}

bool ScrollArea::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (e.type == SDL_MOUSEWHEEL) {
        SDL_Point p = wk::event_point(e);
        if (wk::point_in(rect_, p)) {
            if (content_ && content_->handle_event(e)) return true;
            if (max_scroll_ > 0) {
                set_scroll(scroll_ - e.wheel.y * kWheelStep);
                return true;
            }
        }
        return false;
    }
    if (!content_) return false;
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        SDL_Point p = wk::event_point(e);
        if (!wk::point_in(rect_, p)) return false;
    }
    return content_->handle_event(e);
}

void ScrollArea::update() {
    if (!visible_) return;
    layout();
    if (content_) content_->update();
}

void ScrollArea::render(SDL_Renderer* r) const {
    if (!visible_ || !content_) return;
    {
        wk_draw::ClipScope clip(r, rect_);
        content_->render(r);
    }
    if (max_scroll_ > 0 && rect_.h > 0) {
        const float alpha = effective_opacity();
        const int track_h = rect_.h;
        const int thumb_h = std::max(20, track_h * rect_.h / std::max(1, content_h_));
        const int thumb_y = rect_.y + (track_h - thumb_h) * scroll_ / std::max(1, max_scroll_);
        SDL_Rect thumb{ rect_.x + rect_.w - kScrollbarWidth, thumb_y, kScrollbarWidth, thumb_h };
        SDL_Color c = ThemeManager::instance().color("text_secondary");
        c.a = 120;
        wk_draw::fill_rounded_rect(r, thumb, kScrollbarWidth / 2, c, alpha);
    }
}

int StackedLayout::add(std::unique_ptr<Widget> page) {
    if (!page) return -1;
    page->set_parent(this);
    pages_.push_back(std::move(page));
    if (current_ < 0) current_ = 0;
    layout();
    return count() - 1;
}

std::unique_ptr<Widget> StackedLayout::take(int index) {
    if (index < 0 || index >= count()) return nullptr;
    std::unique_ptr<Widget> page = std::move(pages_[static_cast<size_t>(index)]);
    pages_.erase(pages_.begin() + index);
    page->set_parent(nullptr);
    if (pages_.empty()) {
        current_ = -1;
    } else if (index < current_ || current_ >= count()) {
        current_ = std::max(0, current_ - 1);
    }
    layout();
    return page;
}

void StackedLayout::clear() {
    pages_.clear();
    current_ = -1;
}

Widget* StackedLayout::at(int index) const {
    if (index < 0 || index >= count()) return nullptr;
    return pages_[static_cast<size_t>(index)].get();
}

int StackedLayout::index_of(const Widget* page) const {
    for (int i = 0; i < count(); ++i) {
        if (pages_[static_cast<size_t>(i)].get() == page) return i;
    }
    return -1;
}

void StackedLayout::set_current(int index) {
    if (index < 0 || index >= count()) return;
    current_ = index;
    layout();
}

int StackedLayout::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    int w = 0;
    for (const auto& p : pages_) w = std::max(w, p->preferred_width());
    return w;
}

int StackedLayout::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    int h = 0;
    for (const auto& p : pages_) {
        if (p->is_visible()) h = std::max(h, p->height_for_width(w));
    }
    return h;
}

void StackedLayout::layout() {
    if (Widget* page = current_page()) page->set_rect(rect_);
}

bool StackedLayout::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    Widget* page = current_page();
    return page && page->is_visible() && page->handle_event(e);
}

void StackedLayout::update() {
    if (Widget* page = current_page()) page->update();
}

void StackedLayout::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const Widget* page = current_page();
    if (page && page->is_visible()) page->render(r);
}
