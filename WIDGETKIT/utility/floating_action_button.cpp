#include "floating_action_button.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kShadowSpread = 6;
constexpr int kShadowOffsetY = 3;
constexpr int kLabelGap = 12;
constexpr int kLabelPadX = 8;
constexpr int kLabelPadY = 4;

std::string action_name_for(const std::string& text) {
    std::string out = wk_text::to_lower(wk_text::trim(text));
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}
}

FloatingActionButton::FloatingActionButton(const std::string& icon, int diameter)
    : BaseButton(std::string(), ButtonVariant::Primary, ButtonSize::Large), diameter_(diameter) {
    icon_ = icon;
    circular_ = true;
}

void FloatingActionButton::place_in(const SDL_Rect& area) {
    set_rect(SDL_Rect{ area.x + area.w - diameter_ - kMargin, area.y + area.h - diameter_ - kMargin, diameter_,
                       diameter_ });
}

int FloatingActionButton::preferred_width() const { return fixed_w_ >= 0 ? fixed_w_ : diameter_; }

int FloatingActionButton::height_for_width(int) const { return fixed_h_ >= 0 ? fixed_h_ : diameter_; }

void FloatingActionButton::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ButtonStyle st = current_style();
    const SDL_Rect area = visual_rect();
    const float alpha = effective_opacity();
    const int radius = std::min(area.w, area.h) / 2;

    SDL_Rect shadow = area;
    shadow.y += kShadowOffsetY;
    wk_draw::draw_shadow(r, shadow, radius, kShadowSpread, wk::rgba(0, 0, 0, 80), alpha);

    SDL_Color bg = st.bg;
    if (click_.pressed()) bg = st.press_bg;
    else if (hovered_) bg = st.hover_bg;
    wk_draw::fill_circle(r, area.x + area.w / 2, area.y + area.h / 2, radius, bg, alpha);

    const int icon = std::max(12, area.w * 2 / 5);
    wk_icons::draw(r, icon_, wk_draw::centered(area, icon, icon), st.text, alpha);
}

SpeedDialFAB::SpeedDialFAB(const std::string& icon, int diameter)
    : main_(std::make_unique<FloatingActionButton>(icon, diameter)), icon_(icon) {
    main_->set_parent(this);
    main_->set_on_clicked([this]() { toggle(); });
}

SpeedDialFAB::~SpeedDialFAB() = default;

IconButton* SpeedDialFAB::add_action(const std::string& icon, const std::string& label, std::function<void()> cb,
                                     const std::string& name) {
    Action action;
    action.button = std::make_unique<IconButton>(icon, kActionSize);
    action.button->set_parent(this);
    action.button->set_variant(ButtonVariant::Default);
    action.button->set_tooltip(label);
    action.button->hide();
    action.label = label;
    action.name = name.empty() ? action_name_for(label) : name;
    action.cb = std::move(cb);
    IconButton* raw = action.button.get();
    const size_t index = actions_.size();
    raw->set_on_clicked([this, index]() { trigger(index); });
    actions_.push_back(std::move(action));
    place_action(index);
    return raw;
}

IconButton* SpeedDialFAB::action_button(size_t i) const {
    return i < actions_.size() ? actions_[i].button.get() : nullptr;
}

const std::string& SpeedDialFAB::action_label(size_t i) const {
    static const std::string kEmpty;
    return i < actions_.size() ? actions_[i].label : kEmpty;
}

std::vector<std::string> SpeedDialFAB::action_names() const {
    std::vector<std::string> out;
    for (const auto& a : actions_) out.push_back(a.name);
    return out;
}

bool SpeedDialFAB::trigger(size_t i) {
    if (i >= actions_.size()) return false;
    const std::string name = actions_[i].name;
    const std::function<void()> cb = actions_[i].cb;
    if (cb) cb();
    collapse();
    if (on_action_triggered_) on_action_triggered_(name);
    return true;
}

void SpeedDialFAB::expand() {
    if (expanded_ || actions_.empty()) return;
    expanded_ = true;
    main_->set_icon("close");
    for (size_t i = 0; i < actions_.size(); ++i) {
        actions_[i].button->show();
        const Uint32 duration = kExpandMs + static_cast<Uint32>(i) * kStaggerMs;
        animate("action" + std::to_string(i), actions_[i].progress, 1.0f, duration,
                [this, i](float v) {
                    actions_[i].progress = v;
                    place_action(i);
                });
    }
    if (on_expanded_changed_) on_expanded_changed_(true);
}

void SpeedDialFAB::collapse() {
    if (!expanded_) return;
    expanded_ = false;
    main_->set_icon(icon_);
    for (size_t i = 0; i < actions_.size(); ++i) {
        animate("action" + std::to_string(i), actions_[i].progress, 0.0f, kCollapseMs,
                [this, i](float v) {
                    actions_[i].progress = v;
                    place_action(i);
                },
                [this, i]() { actions_[i].button->hide(); }, Easing::InOutQuad);
    }
    if (on_expanded_changed_) on_expanded_changed_(false);
}

SDL_Rect SpeedDialFAB::action_rect_at(size_t i, float progress) const {
    const int x = rect_.x + (rect_.w - kActionSize) / 2;
    const int home_y = rect_.y + (rect_.h - kActionSize) / 2;
    const int target_y = rect_.y - static_cast<int>(i + 1) * kSpacing;
    const int y = home_y + static_cast<int>((target_y - home_y) * progress);
    return SDL_Rect{ x, y, kActionSize, kActionSize };
}

SDL_Rect SpeedDialFAB::action_target(size_t i) const { return action_rect_at(i, 1.0f); }

void SpeedDialFAB::place_action(size_t i) {
    if (i < actions_.size()) actions_[i].button->set_rect(action_rect_at(i, actions_[i].progress));
}

void SpeedDialFAB::place_in(const SDL_Rect& area) {
    main_->place_in(area);
    set_rect(main_->rect());
}

void SpeedDialFAB::set_visible(bool v) {
    if (!v) {
        stop_all_animations();
        expanded_ = false;
        main_->set_icon(icon_);
        for (auto& a : actions_) {
            a.progress = 0.0f;
            a.button->hide();
        }
    }
    Widget::set_visible(v);
    layout();
}

int SpeedDialFAB::preferred_width() const { return fixed_w_ >= 0 ? fixed_w_ : main_->diameter(); }

int SpeedDialFAB::height_for_width(int) const { return fixed_h_ >= 0 ? fixed_h_ : main_->diameter(); }

void SpeedDialFAB::layout() {
    main_->set_rect(rect_);
    for (size_t i = 0; i < actions_.size(); ++i) place_action(i);
}

bool SpeedDialFAB::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    for (auto& a : actions_) {
        if (a.button->is_visible() && a.button->handle_event(e)) return true;
    }
    if (main_->handle_event(e)) return true;
    if (expanded_ && wk::is_key(e, SDLK_ESCAPE)) {
        collapse();
        return true;
    }
    return false;
}

void SpeedDialFAB::update() {
    AnimatedWidget::update();
    main_->update();
    for (auto& a : actions_) a.button->update();
}

void SpeedDialFAB::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    for (size_t i = actions_.size(); i-- > 0;) {
        const Action& a = actions_[i];
        if (!a.button->is_visible()) continue;
        const SDL_Rect br = a.button->rect();
        wk_draw::draw_shadow(r, br, kActionSize / 2, 3, wk::rgba(0, 0, 0, 50), alpha * a.progress);
        wk_draw::fill_circle(r, br.x + br.w / 2, br.y + br.h / 2, br.w / 2, tm.color("surface"), alpha * a.progress);
        a.button->render(r);
        if (a.label.empty() || a.progress < 0.5f) continue;
        const LabelStyle st = Styles::Label("caption", "text");
        const SDL_Point size = wk_text::measure(st, a.label);
        const SDL_Rect pill{ br.x - kLabelGap - size.x - 2 * kLabelPadX, br.y + (br.h - size.y) / 2 - kLabelPadY,
                             size.x + 2 * kLabelPadX, size.y + 2 * kLabelPadY };
        const float label_alpha = alpha * (a.progress - 0.5f) * 2.0f;
        wk_draw::fill_rounded_rect(r, pill, 4, tm.color("surface"), label_alpha);
        wk_draw::draw_rounded_rect(r, pill, 4, tm.color("border"), label_alpha);
        wk_text::draw_in_rect(r, st, a.label, pill, wk_text::Align::Center, label_alpha);
    }
    main_->render(r);
}
