#include "snackbar.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kCloseSize = 32;

std::string background_role(const std::string& kind) {
    if (kind == "success" || kind == "warning" || kind == "info") return kind;
    if (kind == "error") return "danger";
    return "dark";
}
}

Snackbar::Snackbar(const std::string& message, const std::string& action_text, Uint32 duration)
    : BasePopup(false), duration_(duration) {
    set_overlay_mode(OverlayManager::Mode::Passive);
    set_fixed_height(kHeight);
    content_->set_margins(16, 8, 8, 8);

    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 16);
    auto label = std::make_unique<Label>(message);
    label->set_color(wk::rgba(255, 255, 255));
    message_ = row->add_widget(std::move(label), 1);

    auto action = std::make_unique<BaseButton>(action_text, ButtonVariant::Ghost, ButtonSize::Small);
    action->set_on_clicked([this]() {
        if (on_action_clicked_) on_action_clicked_();
        slide_out();
    });
    action_ = row->add_widget(std::move(action));
    action_->set_visible(!action_text.empty());

    auto close = std::make_unique<IconButton>("close", kCloseSize);
    close->set_on_clicked([this]() { slide_out(); });
    close_ = row->add_widget(std::move(close));
    content_->add(std::move(row), 1);

    close_timer_.set_on_timeout([this]() { slide_out(); });
}

void Snackbar::set_message(const std::string& m) {
    message_->set_text(m);
}

const std::string& Snackbar::message() const {
    return message_->text();
}

void Snackbar::set_action_text(const std::string& t) {
    action_->set_text(t);
    action_->set_visible(!t.empty());
}

const std::string& Snackbar::action_text() const {
    return action_->text();
}

int Snackbar::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kMinWidth, std::min(kMaxWidth, content_->preferred_width()));
}

int Snackbar::target_y() const {
    return OverlayManager::instance().screen_rect().h - kBottomOffset;
}

void Snackbar::show_snackbar() {
    const SDL_Rect screen = OverlayManager::instance().screen_rect();
    const int w = preferred_width();
    const int x = screen.x + (screen.w - w) / 2;
    open_at(SDL_Rect{ x, target_y(), w, kHeight });
    const int end_y = rect_.y;
    set_position(x, screen.y + screen.h);
    animate("slide", static_cast<float>(screen.y + screen.h), static_cast<float>(end_y), kSlideInMs,
            [this](float v) { set_position(rect_.x, static_cast<int>(v)); });
    if (duration_ > 0) auto_close(duration_);
}

void Snackbar::slide_out() {
    if (closing_ || !visible_) return;
    closing_ = true;
    close_timer_.stop();
    const SDL_Rect screen = OverlayManager::instance().screen_rect();
    animate("slide", static_cast<float>(rect_.y), static_cast<float>(screen.y + screen.h), kSlideOutMs,
            [this](float v) { set_position(rect_.x, static_cast<int>(v)); },
            [this]() { close(); }, Easing::InOutQuad);
}

void Snackbar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("md");
    wk_draw::draw_shadow(r, rect_, radius, 4, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color(background_role(kind_)), alpha);
    wk_draw::ClipScope clip(r, rect_);
    content_->render(r);
}

Snackbar* SnackbarManager::show_snackbar(const std::string& message, const std::string& action_text,
                                         Uint32 duration, std::function<void()> on_action) {
    Pending p{ message, action_text, duration, std::move(on_action) };
    if (current_) {
        queue_.push_back(std::move(p));
        return nullptr;
    }
    return present(std::move(p));
}

Snackbar* SnackbarManager::show_undo_snackbar(const std::string& message, std::function<void()> on_undo,
                                              Uint32 duration) {
    return show_snackbar(message, "UNDO", duration, std::move(on_undo));
}

Snackbar* SnackbarManager::show_retry_snackbar(const std::string& message, std::function<void()> on_retry,
                                               Uint32 duration) {
    return show_snackbar(message, "RETRY", duration, std::move(on_retry));
}

Snackbar* SnackbarManager::present(Pending p) {
    current_ = std::make_unique<Snackbar>(p.message, p.action_text, p.duration);
    current_closed_ = false;
    current_->set_on_action_clicked(std::move(p.on_action));
    current_->set_on_closed([this]() { current_closed_ = true; });
    current_->show_snackbar();
    return current_.get();
}

void SnackbarManager::close_current() {
    if (current_) current_->slide_out();
}

void SnackbarManager::update() {
    if (!current_ || !current_closed_) return;
    current_.reset();
    current_closed_ = false;
    if (queue_.empty()) return;
    Pending next = std::move(queue_.front());
    queue_.pop_front();
    present(std::move(next));
}
