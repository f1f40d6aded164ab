#include "base_button.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"

namespace {
constexpr Uint32 kClickAnimMs = 100;
constexpr float kPressedScale = 0.95f;
constexpr int kIconTextGap = 6;

struct SizeMetrics {
    int pad_x;
    int pad_y;
    int min_w;
    int min_h;
};

SizeMetrics metrics(ButtonSize size) {
    switch (size) {
    case ButtonSize::Small: return SizeMetrics{ 8, 4, 60, 24 };
    case ButtonSize::Large: return SizeMetrics{ 24, 12, 120, 44 };
    case ButtonSize::Medium:
    default: return SizeMetrics{ 16, 8, 80, 32 };
    }
}
}

BaseButton::BaseButton(const std::string& text, ButtonVariant variant, ButtonSize size)
    : text_(text), variant_(variant), size_(size) {}

BaseButton::~BaseButton() {
    if (group_) group_->remove_button(this);
}

void BaseButton::set_loading(bool loading) {
    if (loading == loading_) return;
    loading_ = loading;
    if (loading_) {
        text_before_loading_ = text_;
        text_ = "Loading...";
        set_enabled(false);
    } else {
        text_ = text_before_loading_;
        set_enabled(true);
    }
}

void BaseButton::set_checked(bool c) {
    if (c == checked_) return;
    checked_ = c;
    on_checked_changed(checked_);
}

void BaseButton::click() {
    if (!enabled_ || !visible_) return;
    if (checkable_) {
        checked_ = !checked_;
        on_checked_changed(checked_);
        if (on_toggled_) on_toggled_(checked_);
    }
    if (group_) group_->button_clicked(this);
    if (on_clicked_) on_clicked_();
}

void BaseButton::animate_click() {
    animate("scale", 1.0f, kPressedScale, kClickAnimMs, [this](float v) { scale_ = v; },
            [this]() {
                animate("scale", kPressedScale, 1.0f, kClickAnimMs, [this](float v) { scale_ = v; });
            });
}

int BaseButton::min_width() const { return metrics(size_).min_w; }

int BaseButton::min_height() const { return metrics(size_).min_h; }

int BaseButton::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const ButtonStyle st = current_style();
    const SizeMetrics m = metrics(size_);
    int content = wk_text::width(st.label, text_);
    if (!icon_.empty()) content += st.label.font_size + (text_.empty() ? 0 : kIconTextGap);
    return std::max(m.min_w, content + 2 * m.pad_x);
}

int BaseButton::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const SizeMetrics m = metrics(size_);
    return std::max(m.min_h, wk_text::line_height(current_style().label) + 2 * m.pad_y);
}

bool BaseButton::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
        animate_click();
        return true;
    case ClickTracker::Result::Clicked:
        click();
        return true;
    case ClickTracker::Result::Released:
        return true;
    default:
        break;
    }
    if (hovered_ && (wk::is_key(e, SDLK_SPACE))) {
        click();
        return true;
    }
    return false;
}

ButtonStyle BaseButton::current_style() const {
    if (!enabled_) return Styles::DisabledButton(size_);
    return Styles::Button(variant_, size_);
}

int BaseButton::corner_radius(const ButtonStyle& st, const SDL_Rect& r) const {
    return circular_ ? std::min(r.w, r.h) / 2 : st.radius;
}

void BaseButton::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ButtonStyle st = current_style();
    const SDL_Rect area = visual_rect();
    const float alpha = effective_opacity();
    const int radius = corner_radius(st, area);

    SDL_Color bg = st.bg;
    if (click_.pressed() || (checkable_ && checked_)) bg = st.press_bg;
    else if (hovered_) bg = st.hover_bg;
    if (bg.a > 0) wk_draw::fill_rounded_rect(r, area, radius, bg, alpha);
    if (st.border.a > 0) wk_draw::draw_rounded_rect(r, area, radius, st.border, alpha);

    LabelStyle label = st.label;
    label.color = st.text;
    const int icon_size = icon_.empty() ? 0 : label.font_size;
    const int text_w = wk_text::width(label, text_);
    const int gap = (icon_size > 0 && !text_.empty()) ? kIconTextGap : 0;
    const int content_w = std::min(area.w, icon_size + gap + text_w);
    int x = area.x + (area.w - content_w) / 2;
    const int cy = area.y + area.h / 2;
    if (icon_size > 0 && !icon_right_) {
        wk_icons::draw(r, icon_, SDL_Rect{ x, cy - icon_size / 2, icon_size, icon_size }, st.text, alpha);
        x += icon_size + gap;
    }
    if (!text_.empty()) {
        const int avail = std::max(0, content_w - icon_size - gap);
        wk_text::draw_in_rect(r, label, text_, SDL_Rect{ x, area.y, avail, area.h }, wk_text::Align::Center, alpha);
        x += avail + gap;
    }
    if (icon_size > 0 && icon_right_) {
        wk_icons::draw(r, icon_, SDL_Rect{ x, cy - icon_size / 2, icon_size, icon_size }, st.text, alpha);
    }
}

IconButton::IconButton(const std::string& icon, int diameter)
    : BaseButton(std::string(), ButtonVariant::Ghost, ButtonSize::Medium), diameter_(diameter) {
    icon_ = icon;
    circular_ = true;
}

int IconButton::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : diameter_;
}

int IconButton::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : diameter_;
}

ToggleButton::ToggleButton(const std::string& text)
    : BaseButton(text, ButtonVariant::Secondary, ButtonSize::Medium) {
    checkable_ = true;
}

void ToggleButton::on_checked_changed(bool checked) {
    variant_ = checked ? ButtonVariant::Primary : ButtonVariant::Secondary;
}

ButtonGroup::~ButtonGroup() {
    for (BaseButton* b : buttons_) b->group_ = nullptr;
}

void ButtonGroup::add_button(BaseButton* button) {
    if (!button || button->group_ == this) return;
    if (button->group_) button->group_->remove_button(button);
    button->set_checkable(true);
    button->group_ = this;
    buttons_.push_back(button);
    if (button->is_checked()) {
        if (active_) active_->set_checked(false);
        active_ = button;
    }
}

void ButtonGroup::remove_button(BaseButton* button) {
    auto it = std::find(buttons_.begin(), buttons_.end(), button);
    if (it == buttons_.end()) return;
    buttons_.erase(it);
    button->group_ = nullptr;
    if (active_ == button) active_ = nullptr;
}

int ButtonGroup::checked_index() const {
    auto it = std::find(buttons_.begin(), buttons_.end(), active_);
    return it == buttons_.end() ? -1 : static_cast<int>(it - buttons_.begin());
}

void ButtonGroup::set_checked_index(int idx) {
    if (idx < 0 || idx >= static_cast<int>(buttons_.size())) return;
    for (size_t i = 0; i < buttons_.size(); ++i) buttons_[i]->set_checked(static_cast<int>(i) == idx);
    active_ = buttons_[static_cast<size_t>(idx)];
}

void ButtonGroup::button_clicked(BaseButton* button) {
    if (button->is_checked()) {
        for (BaseButton* other : buttons_) {
            if (other != button && other->is_checked()) other->set_checked(false);
        }
        active_ = button;
    } else if (active_ == button) {
        active_ = nullptr;
    }
    if (on_button_clicked_) {
        auto it = std::find(buttons_.begin(), buttons_.end(), button);
        if (it != buttons_.end()) on_button_clicked_(static_cast<int>(it - buttons_.begin()));
    }
}
