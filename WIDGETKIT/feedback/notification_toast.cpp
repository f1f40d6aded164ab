#include "notification_toast.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kIconSize = 24;
constexpr int kCloseSize = 20;
constexpr int kProgressHeight = 4;
constexpr Uint32 kDoneDelayMs = 1000;
constexpr Uint32 kErrorDurationMs = 5000;

bool is_bottom(PopupPosition p) {
    return p == PopupPosition::BottomLeft || p == PopupPosition::BottomRight || p == PopupPosition::BottomCenter;
}
}

NotificationToast::NotificationToast(const std::string& title, const std::string& message, const std::string& type,
                                     Uint32 duration)
    : BasePopup(false), type_(type), duration_(duration) {
    set_overlay_mode(OverlayManager::Mode::Passive);
    set_fixed_width(kWidth);
    content_->set_margins(16, 12, 16, 12);
    content_->set_spacing(8);

    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12);
    row->set_alignment(BoxLayout::Align::Start);
    auto icon = std::make_unique<IconGlyph>(icon_for(type), kIconSize);
    icon->set_color(wk::rgba(255, 255, 255));
    row->add(std::move(icon));

    auto column = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4);
    auto t = std::make_unique<Label>(title);
    t->set_bold(true);
    t->set_color(wk::rgba(255, 255, 255));
    title_ = column->add_widget(std::move(t));
    title_->set_visible(!title.empty());
    auto m = std::make_unique<Label>(message);
    m->set_word_wrap(true);
    m->set_color(wk::rgba(255, 255, 255));
    message_ = column->add_widget(std::move(m));
    message_->set_visible(!message.empty());
    row->add(std::move(column), 1);

    auto close = std::make_unique<IconButton>("close", kCloseSize);
    close->set_on_clicked([this]() { close_animated(); });
    row->add(std::move(close));
    content_->add(std::move(row));

    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    actions->add_stretch();
    actions_ = content_->add_widget(std::move(actions));
    actions_->hide();

    done_timer_.set_on_timeout([this]() { close_animated(); });
}

std::string NotificationToast::icon_for(const std::string& type) {
    if (type == "success") return "success";
    if (type == "warning") return "warning";
    if (type == "error") return "error";
    return "info";
}

std::string NotificationToast::color_role_for(const std::string& type) {
    if (type == "success" || type == "warning") return type;
    if (type == "error") return "danger";
    return "info";
}

void NotificationToast::set_title(const std::string& t) {
    title_->set_text(t);
    title_->set_visible(!t.empty());
}

const std::string& NotificationToast::title() const {
    return title_->text();
}

void NotificationToast::set_message(const std::string& m) {
    message_->set_text(m);
    message_->set_visible(!m.empty());
}

const std::string& NotificationToast::message() const {
    return message_->text();
}

BaseButton* NotificationToast::add_action(const std::string& text, const std::string& name) {
    const std::string key = name.empty() ? text : name;
    auto button = std::make_unique<BaseButton>(text, ButtonVariant::Ghost, ButtonSize::Small);
    button->set_on_clicked([this, key]() {
        if (on_action_clicked_) on_action_clicked_(key);
        close_animated();
    });
    BaseButton* raw = actions_->add_widget(std::move(button));
    actions_->show();
    ++action_count_;
    return raw;
}

void NotificationToast::set_progress(int percent) {
    if (percent < 0) {
        progress_ = -1;
        done_timer_.stop();
        return;
    }
    progress_ = std::min(100, percent);
    if (progress_ >= 100 && !done_timer_.is_active()) done_timer_.start(kDoneDelayMs);
}

void NotificationToast::show_toast_at(int x, int y) {
    const int h = height_for_width(kWidth);
    open_at(SDL_Rect{ x, y, kWidth, h });
    const int end_y = rect_.y;
    animate("slide", static_cast<float>(end_y - kSlideDistance), static_cast<float>(end_y), kSlideMs,
            [this](float v) { set_position(rect_.x, static_cast<int>(v)); });
    if (duration_ > 0) auto_close(duration_);
}

void NotificationToast::show_toast(PopupPosition position) {
    const int h = height_for_width(kWidth);
    const SDL_Rect r = wk::anchor_rect(OverlayManager::instance().screen_rect(), kWidth, h, position,
                                       ToastManager::kMargin);
    show_toast_at(r.x, r.y);
}

void NotificationToast::update() {
    if (!visible_) return;
    BasePopup::update();
    done_timer_.poll();
}

void NotificationToast::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("md");
    wk_draw::draw_shadow(r, rect_, radius, 4, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color(color_role_for(type_)), alpha);
    {
        wk_draw::ClipScope clip(r, rect_);
        content_->render(r);
    }
    if (progress_ >= 0) {
        const SDL_Rect track{ rect_.x + radius, rect_.y + rect_.h - kProgressHeight - 2, rect_.w - 2 * radius,
                              kProgressHeight };
        wk_draw::fill_rounded_rect(r, track, 2, wk::rgba(255, 255, 255, 77), alpha);
        SDL_Rect fill = track;
        fill.w = track.w * progress_ / 100;
        if (fill.w > 0) wk_draw::fill_rounded_rect(r, fill, 2, wk::rgba(255, 255, 255), alpha);
    }
}

NotificationToast* ToastManager::show_toast(const std::string& title, const std::string& message,
                                            const std::string& type, Uint32 duration, PopupPosition position) {
    while (active_count() >= max_toasts_) {
        auto oldest = std::find_if(entries_.begin(), entries_.end(), [](const Entry& e) { return e.active; });
        if (oldest == entries_.end()) break;
        retire(*oldest);
    }

    const int offset = stack_offset(position);
    auto toast = std::make_unique<NotificationToast>(title, message, type, duration);
    NotificationToast* raw = toast.get();
    raw->set_on_closed([this, raw]() {
        for (Entry& e : entries_) {
            if (e.toast.get() == raw) e.active = false;
        }
    });
    const int h = raw->height_for_width(NotificationToast::kWidth);
    const SDL_Rect anchor = wk::anchor_rect(OverlayManager::instance().screen_rect(), NotificationToast::kWidth, h,
                                            position, kMargin);
    const int y = is_bottom(position) ? anchor.y - offset : anchor.y + offset;

    Entry entry;
    entry.toast = std::move(toast);
    entry.position = position;
    entries_.push_back(std::move(entry));
    raw->show_toast_at(anchor.x, y);
    return raw;
}

NotificationToast* ToastManager::show_info(const std::string& title, const std::string& message) {
    return show_toast(title, message, "info", 3000, default_position_);
}

NotificationToast* ToastManager::show_success(const std::string& title, const std::string& message) {
    return show_toast(title, message, "success", 3000, default_position_);
}

NotificationToast* ToastManager::show_warning(const std::string& title, const std::string& message) {
    return show_toast(title, message, "warning", 3000, default_position_);
}

NotificationToast* ToastManager::show_error(const std::string& title, const std::string& message) {
    return show_toast(title, message, "error", kErrorDurationMs, default_position_);
}

void ToastManager::set_max_toasts(size_t n) {
    max_toasts_ = std::max<size_t>(1, n);
    while (active_count() > max_toasts_) {
        auto oldest = std::find_if(entries_.begin(), entries_.end(), [](const Entry& e) { return e.active; });
        retire(*oldest);
    }
}

void ToastManager::retire(Entry& e) {
    e.active = false;
    e.toast->close_animated();
}

int ToastManager::stack_offset(PopupPosition pos) const {
    int offset = 0;
    for (const Entry& e : entries_) {
        if (e.active && e.position == pos) offset += e.toast->rect().h + kSpacing;
    }
    return offset;
}

void ToastManager::clear_all() {
    for (Entry& e : entries_) {
        if (e.active) retire(e);
    }
}

size_t ToastManager::active_count() const {
    return static_cast<size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const Entry& e) { return e.active; }));
}

std::vector<NotificationToast*> ToastManager::active_toasts() const {
    std::vector<NotificationToast*> out;
    for (const Entry& e : entries_) {
        if (e.active) out.push_back(e.toast.get());
    }
    return out;
}

void ToastManager::update() {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return !e.active && !e.toast->is_visible(); }),
                   entries_.end());
}
