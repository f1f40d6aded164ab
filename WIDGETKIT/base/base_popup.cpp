#include "base_popup.hpp"

#include <algorithm>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kContentMargin = 16;
constexpr Uint8 kBackdropAlpha = 110;
constexpr int kShadowSpread = 6;
constexpr int kMenuItemHeight = 30;
constexpr int kMenuItemPad = 10;
constexpr int kMenuIconSize = 14;
}

namespace wk {

PopupPosition parse_popup_position(const std::string& s) {
    if (s == "top-right") return PopupPosition::TopRight;
    if (s == "top-left") return PopupPosition::TopLeft;
    if (s == "bottom-right") return PopupPosition::BottomRight;
    if (s == "bottom-left") return PopupPosition::BottomLeft;
    if (s == "top-center") return PopupPosition::TopCenter;
    if (s == "bottom-center") return PopupPosition::BottomCenter;
    return PopupPosition::Center;
}

SDL_Rect anchor_rect(const SDL_Rect& area, int w, int h, PopupPosition pos, int margin) {
    const int left = area.x + margin;
    const int right = area.x + area.w - w - margin;
    const int top = area.y + margin;
    const int bottom = area.y + area.h - h - margin;
    const int cx = area.x + (area.w - w) / 2;
    const int cy = area.y + (area.h - h) / 2;
    switch (pos) {
    case PopupPosition::TopRight: return SDL_Rect{ right, top, w, h };
    case PopupPosition::TopLeft: return SDL_Rect{ left, top, w, h };
    case PopupPosition::BottomRight: return SDL_Rect{ right, bottom, w, h };
    case PopupPosition::BottomLeft: return SDL_Rect{ left, bottom, w, h };
    case PopupPosition::TopCenter: return SDL_Rect{ cx, top, w, h };
    case PopupPosition::BottomCenter: return SDL_Rect{ cx, bottom, w, h };
    case PopupPosition::Center:
    default: return SDL_Rect{ cx, cy, w, h };
    }
}

}

BasePopup::BasePopup(bool modal)
    : content_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical)),
      modal_(modal),
      mode_(modal ? OverlayManager::Mode::Modal : OverlayManager::Mode::LightDismiss) {
    content_->set_margins(kContentMargin);
    content_->set_parent(this);
    close_timer_.set_on_timeout([this]() { close_animated(); });
    visible_ = false;
}

BasePopup::~BasePopup() {
    OverlayManager::instance().close(this);
}

int BasePopup::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kMinWidth, content_->preferred_width());
}

int BasePopup::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return content_->height_for_width(w);
}

void BasePopup::open_at(const SDL_Rect& r) {
    OverlayManager& om = OverlayManager::instance();
    set_rect(om.clamp_to_screen(r));
    closing_ = false;
    stop_animation("opacity");
    show();
    om.open(this, mode_, [this]() { close(); });
    AnimationHelpers::fade_in(*this, kFadeMs);
}

void BasePopup::show_at_position(int x, int y) {
    const int w = preferred_width();
    open_at(SDL_Rect{ x, y, w, height_for_width(w) });
}

void BasePopup::show_centered() {
    show_centered(OverlayManager::instance().screen_rect());
}

void BasePopup::show_centered(const SDL_Rect& parent_rect) {
    const int w = preferred_width();
    const int h = height_for_width(w);
    open_at(wk::anchor_rect(parent_rect, w, h, PopupPosition::Center, 0));
}

void BasePopup::show_at_cursor() {
    int x = 0;
    int y = 0;
    SDL_GetMouseState(&x, &y);
    show_at_position(x, y);
}

void BasePopup::auto_close(Uint32 delay_ms) {
    close_timer_.start(delay_ms);
}

void BasePopup::close_animated() {
    if (closing_ || !visible_) return;
    closing_ = true;
    close_timer_.stop();
    AnimationHelpers::fade_out(*this, kFadeMs, [this]() {
        closing_ = false;
        close();
    });
}

void BasePopup::close() {
    const bool was_open = visible_ || OverlayManager::instance().is_open(this);
    close_timer_.stop();
    stop_animation("opacity");
    closing_ = false;
    visible_ = false;
    hovered_ = false;
    OverlayManager::instance().close(this);
    set_opacity(1.0f);
    if (!was_open) return;
    auto cb = on_closed_;
    if (cb) cb();
}

void BasePopup::layout() {
    content_->set_rect(rect_);
}

bool BasePopup::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    if (wk::is_key(e, SDLK_ESCAPE)) {
        close();
        return true;
    }
    track_hover(e);
    if (content_->handle_event(e)) return true;
    if (wk::is_left_press(e)) {
        const SDL_Point p{ e.button.x, e.button.y };
        if (!wk::point_in(rect_, p)) {
            if (modal_) {
                close();
                return true;
            }
            return false;
        }
        return true;
    }
    return false;
}

void BasePopup::update() {
    if (!visible_) return;
    AnimatedWidget::update();
    if (!visible_) return;
    close_timer_.poll();
    layout();
    content_->update();
}

void BasePopup::render_backdrop(SDL_Renderer* r) const {
    if (!modal_) return;
    wk_draw::fill_rect(r, OverlayManager::instance().screen_rect(), wk::rgba(0, 0, 0, kBackdropAlpha),
                       effective_opacity());
}

void BasePopup::render_frame(SDL_Renderer* r) const {
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("lg");
    wk_draw::draw_shadow(r, rect_, radius, kShadowSpread, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("background"), alpha);
    wk_draw::draw_rounded_rect(r, rect_, radius, tm.color("border"), alpha);
}

void BasePopup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    render_backdrop(r);
    render_frame(r);
    wk_draw::ClipScope clip(r, rect_);
    content_->render(r);
}

ToastPopup::ToastPopup(const std::string& message, Uint32 duration)
    : BasePopup(false), message_(message), duration_(duration) {
    set_fixed_size(kWidth, kHeight);
    set_overlay_mode(OverlayManager::Mode::Passive);
}

void ToastPopup::show_toast(PopupPosition position) {
    const SDL_Rect screen = OverlayManager::instance().screen_rect();
    const SDL_Rect r = wk::anchor_rect(screen, kWidth, kHeight, position, kMargin);
    show_at_position(r.x, r.y);
    if (duration_ > 0) auto_close(duration_);
}

void ToastPopup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("md");
    wk_draw::draw_shadow(r, rect_, radius, 4, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("dark"), alpha);
    LabelStyle st = Styles::Label("default");
    st.color = wk::rgba(255, 255, 255);
    wk_text::draw_in_rect(r, st, message_, wk_draw::inset(rect_, kContentMargin, 0),
                          wk_text::Align::Center, alpha);
}

MenuAction::MenuAction(ContextMenuPopup& menu, const std::string& text, std::function<void()> cb,
                       const std::string& icon)
    : menu_(menu), text_(text), icon_(icon), cb_(std::move(cb)) {}

void MenuAction::trigger() {
    if (!enabled_) return;
    menu_.run(cb_);
}

int MenuAction::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int icon_w = icon_.empty() ? 0 : kMenuIconSize + kMenuItemPad;
    return wk_text::width(Styles::Label("default"), text_) + icon_w + 2 * kMenuItemPad;
}

int MenuAction::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : kMenuItemHeight;
}

bool MenuAction::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        trigger();
        return true;
    default:
        break;
    }
    if (hovered_ && wk::is_key(e, SDLK_RETURN)) {
        trigger();
        return true;
    }
    return false;
}

void MenuAction::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : 0.5f);
    if (hovered_) wk_draw::fill_rounded_rect(r, rect_, tm.border_radius("sm"), tm.color("hover"), alpha);
    int x = rect_.x + kMenuItemPad;
    if (!icon_.empty()) {
        const SDL_Rect area{ x, rect_.y + (rect_.h - kMenuIconSize) / 2, kMenuIconSize, kMenuIconSize };
        wk_icons::draw(r, icon_, area, tm.color("text_secondary"), alpha);
        x += kMenuIconSize + kMenuItemPad;
    }
    wk_text::draw_in_rect(r, Styles::Label("default"), text_,
                          SDL_Rect{ x, rect_.y, rect_.x + rect_.w - x - kMenuItemPad, rect_.h },
                          wk_text::Align::Left, alpha);
}

ContextMenuPopup::ContextMenuPopup() : BasePopup(false) {
    content_->set_margins(4);
    content_->set_spacing(2);
}

MenuAction* ContextMenuPopup::add_action(const std::string& text, std::function<void()> cb,
                                         const std::string& icon) {
    auto* a = content_->add_widget(std::make_unique<MenuAction>(*this, text, std::move(cb), icon));
    actions_.push_back(a);
    return a;
}

void ContextMenuPopup::add_separator() {
    content_->add(std::make_unique<Separator>());
}

void ContextMenuPopup::trigger(size_t i) {
    if (i < actions_.size()) actions_[i]->trigger();
}

void ContextMenuPopup::run(const std::function<void()>& cb) {
    const std::function<void()> copy = cb;
    if (copy) copy();
    close_animated();
}
