#include "slider.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kBoxTopPadding = 5;
constexpr int kBoxBottomPadding = 5;
constexpr int kLabelControlGap = 5;
constexpr int kTrackHeight = 8;
constexpr float kDisabledAlpha = 0.5f;

bool is_commit_key(const SDL_Event& e) {
    return wk::is_key(e, SDLK_RETURN) || wk::is_key(e, SDLK_KP_ENTER);
}

void draw_knob(SDL_Renderer* r, const SDL_Rect& k, bool hot, const SliderStyle& st, float alpha) {
    wk_draw::fill_rounded_rect(r, k, 3, hot ? st.knob_hover : st.knob, alpha);
    wk_draw::draw_rounded_rect(r, k, 3, hot ? st.knob_border_hover : st.knob_border, alpha);
}
}

namespace wk {
bool parse_int(const std::string& text, int& out) {
    const std::string t = wk_text::trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}
}

Slider::Slider(int min_val, int max_val, int value, const std::string& label)
    : label_(label), min_(std::min(min_val, max_val)), max_(std::max(min_val, max_val)),
      value_(std::max(min_, std::min(max_, value))) {}

Slider::~Slider() = default;

void Slider::set_value(int v) {
    const int clamped = std::max(min_, std::min(max_, v));
    if (clamped == value_) return;
    value_ = clamped;
    if (on_value_changed_) on_value_changed_(value_);
}

void Slider::set_range(int min_val, int max_val) {
    min_ = std::min(min_val, max_val);
    max_ = std::max(min_val, max_val);
    set_value(value_);
}

int Slider::label_height() const {
    if (label_.empty()) return 0;
    return wk_text::line_height(Styles::Slider().label);
}

SDL_Rect Slider::content_rect() const {
    const int lh = label_height();
    const int y = rect_.y + kBoxTopPadding + lh + (lh > 0 ? kLabelControlGap : 0);
    const int h = std::max(0, rect_.y + rect_.h - kBoxBottomPadding - y);
    return SDL_Rect{ rect_.x, y, rect_.w, h };
}

SDL_Rect Slider::value_rect() const {
    const SDL_Rect c = content_rect();
    if (!show_value_) return SDL_Rect{ c.x + c.w, c.y, 0, c.h };
    const int width = std::min(kValueWidth, c.w);
    return SDL_Rect{ c.x + std::max(0, c.w - width), c.y, width, c.h };
}

SDL_Rect Slider::track_rect() const {
    const SDL_Rect c = content_rect();
    const int track_width = std::max(0, c.w - (show_value_ ? kValueWidth : 0));
    return SDL_Rect{ c.x, c.y + c.h / 2 - kTrackHeight / 2, track_width, kTrackHeight };
}

SDL_Rect Slider::knob_rect() const {
    const int cx = x_for_value(value_);
    const SDL_Rect tr = track_rect();
    return SDL_Rect{ cx - kKnobWidth / 2, tr.y + tr.h / 2 - kKnobHeight / 2, kKnobWidth, kKnobHeight };
}

int Slider::x_for_value(int v) const {
    const SDL_Rect tr = track_rect();
    const int usable = std::max(1, tr.w - kKnobWidth);
    const int range = std::max(1, max_ - min_);
    return tr.x + kKnobWidth / 2 + static_cast<int>((v - min_) * usable / static_cast<double>(range));
}

int Slider::value_for_x(int x) const {
    const SDL_Rect tr = track_rect();
    const int usable = std::max(1, tr.w - kKnobWidth);
    const double t = (x - tr.x - kKnobWidth / 2) / static_cast<double>(usable);
    const int v = min_ + static_cast<int>(std::lround(t * (max_ - min_)));
    return std::max(min_, std::min(max_, v));
}

int Slider::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 200;
}

int Slider::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int lh = label_height();
    return kBoxTopPadding + lh + (lh > 0 ? kLabelControlGap : 0) + kControlHeight + kBoxBottomPadding;
}

void Slider::layout() {
    if (edit_box_) edit_box_->set_rect(value_rect());
}

void Slider::begin_edit() {
    edit_box_ = std::make_unique<TextBox>(std::to_string(value_));
    edit_box_->set_rect(value_rect());
    edit_box_->set_focus(true);
}

void Slider::finish_edit(bool commit) {
    if (!edit_box_) return;
    int v = 0;
    if (commit && wk::parse_int(edit_box_->text(), v)) set_value(v);
    edit_box_->set_focus(false);
    edit_box_.reset();
}

bool Slider::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (edit_box_) {
        if (is_commit_key(e)) {
            finish_edit(true);
            return true;
        }
        if (wk::is_key(e, SDLK_ESCAPE)) {
            finish_edit(false);
            return true;
        }
        if (wk::is_left_press(e) && !wk::point_in(edit_box_->box_rect(), wk::event_point(e))) {
            finish_edit(true);
        } else if (edit_box_->handle_event(e)) {
            return true;
        }
    }
    track_hover(e);
    const SDL_Rect krect = knob_rect();
    if (e.type == SDL_MOUSEMOTION) {
        SDL_Point p{ e.motion.x, e.motion.y };
        knob_hovered_ = wk::point_in(krect, p);
        if (dragging_) {
            set_value(value_for_x(p.x));
            return true;
        }
    } else if (wk::is_left_press(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        if (wk::point_in(krect, p)) {
            dragging_ = true;
            return true;
        }
        SDL_Rect hit = track_rect();
        hit.y -= kKnobHeight / 2;
        hit.h += kKnobHeight;
        if (wk::point_in(hit, p)) {
            set_value(value_for_x(p.x));
            dragging_ = true;
            return true;
        }
        const SDL_Rect vr = value_rect();
        if (show_value_ && wk::point_in(vr, p)) {
            begin_edit();
            return true;
        }
    } else if (wk::is_left_release(e)) {
        if (dragging_) {
            dragging_ = false;
            return true;
        }
    }
    return false;
}

void Slider::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const SliderStyle st = Styles::Slider();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    if (!label_.empty()) {
        wk_text::draw(r, st.label, label_, rect_.x, rect_.y + kBoxTopPadding, alpha);
    }
    const SDL_Rect tr = track_rect();
    wk_draw::fill_rounded_rect(r, tr, kTrackHeight / 2, st.track_bg, alpha);
    SDL_Rect fill{ tr.x, tr.y, std::max(0, x_for_value(value_) - tr.x), tr.h };
    wk_draw::fill_rounded_rect(r, fill, kTrackHeight / 2, st.track_fill, alpha);
    draw_knob(r, knob_rect(), knob_hovered_ || dragging_, st, alpha);
    if (edit_box_) {
        edit_box_->render(r);
    } else if (show_value_) {
        SDL_Rect vr = value_rect();
        vr.x += 6;
        vr.w -= 6;
        wk_text::draw_in_rect(r, st.value, std::to_string(value_), vr, wk_text::Align::Left, alpha);
    }
}

SliderWithInput::SliderWithInput(int min_val, int max_val, int value, const std::string& suffix,
                                 const std::string& label)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4)), suffix_(suffix) {
    layout_->set_parent(this);
    label_ = layout_->add_widget(std::make_unique<Label>(label));
    label_->set_visible(!label.empty());

    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    row->set_alignment(BoxLayout::Align::Center);
    auto slider = std::make_unique<Slider>(min_val, max_val, value);
    slider->set_value_visible(false);
    slider_ = row->add_widget(std::move(slider), 1);
    auto input = std::make_unique<TextBox>(std::to_string(slider_->value()));
    input->set_fixed_width(kInputWidth);
    input_ = row->add_widget(std::move(input));
    suffix_label_ = row->add_widget(std::make_unique<Label>(suffix, "default", "text_secondary"));
    suffix_label_->set_visible(!suffix.empty());
    layout_->add(std::move(row));

    auto range = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 0);
    min_label_ = range->add_widget(std::make_unique<Label>(std::to_string(slider_->minimum()), "caption",
                                                           "text_secondary"));
    range->add_stretch();
    max_label_ = range->add_widget(std::make_unique<Label>(std::to_string(slider_->maximum()), "caption",
                                                           "text_secondary"));
    range->set_margins(0, 0, kInputWidth + 8, 0);
    layout_->add(std::move(range));

    slider_->set_on_value_changed([this](int v) {
        sync_input();
        if (on_value_changed_) on_value_changed_(v);
    });
    input_->set_on_submitted([this](const std::string&) { commit_input(); });
    input_->set_on_focus_changed([this](bool focused) {
        if (!focused) commit_input();
    });
    input_->set_on_escape([this]() { sync_input(); });
}

void SliderWithInput::commit_input() {
    int v = 0;
    if (wk::parse_int(input_->text(), v)) slider_->set_value(v);
    sync_input();
}

void SliderWithInput::sync_input() {
    const std::string s = std::to_string(slider_->value());
    if (input_->text() != s) input_->set_text(s);
}

void SliderWithInput::set_value(int v) {
    slider_->set_value(v);
    sync_input();
}

int SliderWithInput::value() const {
    return slider_->value();
}

void SliderWithInput::set_range(int min_val, int max_val) {
    slider_->set_range(min_val, max_val);
    min_label_->set_text(std::to_string(slider_->minimum()));
    max_label_->set_text(std::to_string(slider_->maximum()));
    sync_input();
    layout();
}

void SliderWithInput::set_suffix(const std::string& s) {
    suffix_ = s;
    suffix_label_->set_text(s);
    suffix_label_->set_visible(!s.empty());
    layout();
}

void SliderWithInput::set_label(const std::string& l) {
    label_->set_text(l);
    label_->set_visible(!l.empty());
    layout();
}

bool SliderWithInput::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void SliderWithInput::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}

RangeSlider::RangeSlider(int min_val, int max_val, int low, int high)
    : min_(std::min(min_val, max_val)), max_(std::max(min_val, max_val)) {
    low_ = min_;
    high_ = max_;
    set_values(low, high);
}

RangeSlider::~RangeSlider() = default;

void RangeSlider::apply(int low, int high) {
    if (low == low_ && high == high_) return;
    low_ = low;
    high_ = high;
    if (on_range_changed_) on_range_changed_(low_, high_);
}

void RangeSlider::set_low(int v) {
    const int clamped = std::max(min_, std::min(high_, v));
    apply(clamped, high_);
}

void RangeSlider::set_high(int v) {
    const int clamped = std::max(low_, std::min(max_, v));
    apply(low_, clamped);
}

void RangeSlider::set_values(int low, int high) {
    if (low > high) std::swap(low, high);
    low = std::max(min_, std::min(max_, low));
    high = std::max(min_, std::min(max_, high));
    apply(low, high);
}

SDL_Rect RangeSlider::low_label_rect() const {
    return SDL_Rect{ rect_.x, rect_.y, kLabelWidth, rect_.h };
}

SDL_Rect RangeSlider::high_label_rect() const {
    return SDL_Rect{ rect_.x + rect_.w - kLabelWidth, rect_.y, kLabelWidth, rect_.h };
}

SDL_Rect RangeSlider::track_rect() const {
    const int width = std::max(0, rect_.w - 2 * kLabelWidth);
    return SDL_Rect{ rect_.x + kLabelWidth, rect_.y + rect_.h / 2 - kTrackHeight / 2, width, kTrackHeight };
}

SDL_Rect RangeSlider::knob_at(int value) const {
    const SDL_Rect tr = track_rect();
    const int range = std::max(1, max_ - min_);
    const int x = tr.x + static_cast<int>((value - min_) * (tr.w - Slider::kKnobWidth) / static_cast<double>(range));
    return SDL_Rect{ x, tr.y + tr.h / 2 - Slider::kKnobHeight / 2, Slider::kKnobWidth, Slider::kKnobHeight };
}

SDL_Rect RangeSlider::low_knob_rect() const {
    return knob_at(low_);
}

SDL_Rect RangeSlider::high_knob_rect() const {
    return knob_at(high_);
}

int RangeSlider::value_for_x(int x) const {
    const SDL_Rect tr = track_rect();
    const double t = (x - tr.x - Slider::kKnobWidth / 2) / static_cast<double>(std::max(1, tr.w - Slider::kKnobWidth));
    const int v = min_ + static_cast<int>(std::lround(t * (max_ - min_)));
    return std::max(min_, std::min(max_, v));
}

int RangeSlider::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 240;
}

int RangeSlider::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return Slider::kControlHeight;
}

void RangeSlider::layout() {
    if (!edit_box_) return;
    edit_box_->set_rect(editing_ == Knob::Low ? low_label_rect() : high_label_rect());
}

void RangeSlider::begin_edit(Knob which) {
    editing_ = which;
    edit_box_ = std::make_unique<TextBox>(std::to_string(which == Knob::Low ? low_ : high_));
    layout();
    edit_box_->set_focus(true);
}

void RangeSlider::finish_edit(bool commit) {
    if (!edit_box_) return;
    int v = 0;
    if (commit && wk::parse_int(edit_box_->text(), v)) {
        if (editing_ == Knob::Low) set_low(v); else set_high(v);
    }
    edit_box_->set_focus(false);
    edit_box_.reset();
    editing_ = Knob::None;
}

bool RangeSlider::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (edit_box_) {
        if (is_commit_key(e)) {
            finish_edit(true);
            return true;
        }
        if (wk::is_key(e, SDLK_ESCAPE)) {
            finish_edit(false);
            return true;
        }
        if (wk::is_left_press(e) && !wk::point_in(edit_box_->box_rect(), wk::event_point(e))) {
            finish_edit(true);
        } else if (edit_box_->handle_event(e)) {
            return true;
        }
    }
    const SDL_Rect kl = low_knob_rect();
    const SDL_Rect kh = high_knob_rect();
    if (e.type == SDL_MOUSEMOTION) {
        SDL_Point p{ e.motion.x, e.motion.y };
        hovered_knob_ = wk::point_in(kh, p) ? Knob::High : (wk::point_in(kl, p) ? Knob::Low : Knob::None);
        if (dragging_ == Knob::Low) {
            set_low(value_for_x(p.x));
            return true;
        }
        if (dragging_ == Knob::High) {
            set_high(value_for_x(p.x));
            return true;
        }
    } else if (wk::is_left_press(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        // When the knobs overlap, grab the one that can still move.
        const bool on_low = wk::point_in(kl, p);
        const bool on_high = wk::point_in(kh, p);
        if (on_low && on_high) {
            dragging_ = low_ == max_ ? Knob::Low : Knob::High;
            return true;
        }
        if (on_high) {
            dragging_ = Knob::High;
            return true;
        }
        if (on_low) {
            dragging_ = Knob::Low;
            return true;
        }
        if (e.button.clicks >= 2) {
            if (wk::point_in(low_label_rect(), p)) {
                begin_edit(Knob::Low);
                return true;
            }
            if (wk::point_in(high_label_rect(), p)) {
                begin_edit(Knob::High);
                return true;
            }
        }
    } else if (wk::is_left_release(e)) {
        if (dragging_ != Knob::None) {
            dragging_ = Knob::None;
            return true;
        }
    }
    return false;
}

void RangeSlider::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const SliderStyle st = Styles::Slider();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const SDL_Rect tr = track_rect();
    wk_draw::fill_rounded_rect(r, tr, kTrackHeight / 2, st.track_bg, alpha);
    const SDL_Rect kl = low_knob_rect();
    const SDL_Rect kh = high_knob_rect();
    SDL_Rect fill{ kl.x + kl.w / 2, tr.y, std::max(0, kh.x - kl.x), tr.h };
    wk_draw::fill_rect(r, fill, st.track_fill, alpha);
    draw_knob(r, kl, hovered_knob_ == Knob::Low || dragging_ == Knob::Low, st, alpha);
    draw_knob(r, kh, hovered_knob_ == Knob::High || dragging_ == Knob::High, st, alpha);
    if (editing_ != Knob::Low) {
        wk_text::draw_in_rect(r, st.value, std::to_string(low_), low_label_rect(), wk_text::Align::Center, alpha);
    }
    if (editing_ != Knob::High) {
        wk_text::draw_in_rect(r, st.value, std::to_string(high_), high_label_rect(), wk_text::Align::Center, alpha);
    }
    if (edit_box_) edit_box_->render(r);
}
