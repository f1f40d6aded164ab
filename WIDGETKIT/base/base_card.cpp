#include "base_card.hpp"

#include <algorithm>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kSectionPadX = 16;
constexpr int kSectionPadY = 12;
constexpr int kBodyPad = 16;
constexpr int kShadowSpread = 4;
constexpr float kSelectedTint = 0.08f;
}

BaseCard::BaseCard()
    : header_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal)),
      body_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical)),
      footer_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal)) {
    header_->set_margins(kSectionPadX, kSectionPadY, kSectionPadX, kSectionPadY);
    body_->set_margins(kBodyPad);
    footer_->set_margins(kSectionPadX, kSectionPadY, kSectionPadX, kSectionPadY);
    header_->set_parent(this);
    body_->set_parent(this);
    footer_->set_parent(this);
    header_->hide();
    footer_->hide();
}

Widget* BaseCard::add_header_action(std::unique_ptr<Widget> w) {
    Widget* raw = header_->add(std::move(w));
    header_->show();
    return raw;
}

Widget* BaseCard::add_footer_widget(std::unique_ptr<Widget> w) {
    Widget* raw = footer_->add(std::move(w));
    footer_->show();
    return raw;
}

void BaseCard::set_title(const std::string& text) {
    if (!title_label_) {
        auto label = std::make_unique<Label>(text, "heading");
        title_label_ = label.get();
        header_->insert(0, std::move(label), 1);
    } else {
        title_label_->set_text(text);
    }
    header_->show();
}

std::string BaseCard::title() const {
    return title_label_ ? title_label_->text() : std::string();
}

void BaseCard::set_selectable(bool s) {
    selectable_ = s;
    if (!selectable_ && selected_) {
        selected_ = false;
        if (on_selection_changed_) on_selection_changed_(false);
    }
}

void BaseCard::set_selected(bool s) {
    if (!selectable_ || s == selected_) return;
    selected_ = s;
    if (on_selection_changed_) on_selection_changed_(selected_);
}

int BaseCard::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    int w = body_->preferred_width();
    if (header_->is_visible()) w = std::max(w, header_->preferred_width());
    if (footer_->is_visible()) w = std::max(w, footer_->preferred_width());
    return w;
}

int BaseCard::content_height(int w) const {
    int h = 0;
    if (header_->is_visible()) h += header_->height_for_width(w);
    if (body_->is_visible()) h += body_->height_for_width(w);
    if (footer_->is_visible()) h += footer_->height_for_width(w);
    return h;
}

int BaseCard::height_for_width(int w) const {
    if (fixed_h_ >= 0) return apply_height_limit(fixed_h_);
    return apply_height_limit(content_height(w));
}

void BaseCard::layout() {
    int y = rect_.y + offset_.y;
    const int x = rect_.x + offset_.x;
    for (BoxLayout* section : { header_.get(), body_.get(), footer_.get() }) {
        if (!section->is_visible()) continue;
        const int h = section->height_for_width(rect_.w);
        section->set_rect(SDL_Rect{ x, y, rect_.w, h });
        y += h;
    }
}

void BaseCard::on_hover_changed(bool hovered) {
    if (hoverable_) {
        const float from = static_cast<float>(offset_.y);
        const float to = hovered ? -static_cast<float>(kHoverLift) : 0.0f;
        animate("lift", from, to, kHoverLiftMs, [this](float v) {
            offset_.y = static_cast<int>(v);
            layout();
        });
    }
    if (hovered) {
        if (on_hover_entered_) on_hover_entered_();
    } else if (on_hover_left_) {
        on_hover_left_();
    }
}

void BaseCard::on_card_clicked() {
    if (selectable_) set_selected(!selected_);
    if (on_clicked_) on_clicked_();
}

bool BaseCard::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    for (BoxLayout* section : { header_.get(), body_.get(), footer_.get() }) {
        if (section->is_visible() && section->handle_event(e)) {
            if (wk::is_left_press(e)) click_.reset();
            return true;
        }
    }
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        on_card_clicked();
        return true;
    default:
        break;
    }
    return false;
}

void BaseCard::update() {
    AnimatedWidget::update();
    layout();
    header_->update();
    body_->update();
    footer_->update();
}

void BaseCard::render_frame(SDL_Renderer* r, const SDL_Rect& area) const {
    const CardStyle st = Styles::Card();
    const float alpha = effective_opacity();
    const SDL_Color primary = ThemeManager::instance().color("primary");
    if (shadow_) wk_draw::draw_shadow(r, area, st.radius, kShadowSpread, st.shadow, alpha);

    SDL_Color bg = st.bg;
    if (selected_) bg = wk::mix(st.bg, primary, kSelectedTint);
    else if (hoverable_ && hovered_) bg = st.hover_bg;
    wk_draw::fill_rounded_rect(r, area, st.radius, bg, alpha);

    if (selected_) {
        wk_draw::draw_rounded_rect(r, area, st.radius, st.selected_border, alpha);
        wk_draw::draw_rounded_rect(r, wk_draw::inset(area, 1, 1), std::max(0, st.radius - 1),
                                   st.selected_border, alpha);
    } else {
        const SDL_Color border = (hoverable_ && hovered_) ? st.selected_border : st.border;
        wk_draw::draw_rounded_rect(r, area, st.radius, border, alpha);
    }
}

void BaseCard::render_sections(SDL_Renderer* r) const {
    for (const BoxLayout* section : { header_.get(), body_.get(), footer_.get() }) {
        if (section->is_visible()) section->render(r);
    }
}

void BaseCard::render(SDL_Renderer* r) const {
    if (!visible_ || rect_.h <= 0) return;
    const SDL_Rect area = visual_rect();
    render_frame(r, area);
    wk_draw::ClipScope clip(r, area);
    render_sections(r);
}
