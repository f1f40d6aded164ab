#include "chat_bubble.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"
#include "user/user_avatar.hpp"

namespace {
constexpr int kRowMarginX = 8;
constexpr int kRowMarginY = 4;
constexpr int kGap = 8;
constexpr int kLineGap = 2;
constexpr int kTypingWidth = 60;
constexpr int kTypingHeight = 30;
constexpr int kDotRadius = 4;

std::string local_time(std::time_t t) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char buf[16];
    const size_t n = std::strftime(buf, sizeof(buf), "%H:%M", &local);
    return std::string(buf, n);
}

LabelStyle message_style(bool own) {
    LabelStyle st = Styles::Label("default", "text");
    if (own) st.color = wk::rgba(255, 255, 255);
    return st;
}
}

ChatBubble::ChatBubble(const std::string& message, const std::string& sender, std::time_t timestamp, bool is_own,
                       const std::string& avatar_path)
    : message_(message), sender_(sender), timestamp_(timestamp != 0 ? timestamp : std::time(nullptr)),
      own_(is_own), avatar_(std::make_unique<UserAvatar>(sender, avatar_path, kAvatarSize)) {
    avatar_->set_parent(this);
}

ChatBubble::~ChatBubble() = default;

std::string ChatBubble::time_text() const {
    return local_time(timestamp_);
}

ChatBubble::Metrics ChatBubble::measure(int w) const {
    Metrics m;
    const LabelStyle caption = Styles::Label("caption", "text_secondary");
    int avail = w - 2 * kRowMarginX;
    if (show_avatar_) avail -= kAvatarSize + kGap;
    const int max_w = std::max(2 * kPadX + 1, std::min(avail, max_bubble_width(w)));
    const LabelStyle st = message_style(own_);
    int text_w = 0;
    for (const std::string& line : wk_text::wrap_lines(st, message_, max_w - 2 * kPadX)) {
        text_w = std::max(text_w, wk_text::width(st, line));
    }
    m.bubble_w = text_w + 2 * kPadX;
    m.bubble_h = wk_text::wrapped_height(st, message_, max_w - 2 * kPadX, kLineGap) + 2 * kPadY;
    if (shows_sender()) m.sender_h = wk_text::line_height(caption) + kLineGap;
    if (show_timestamp_) m.time_h = wk_text::line_height(caption) + kLineGap;
    return m;
}

SDL_Rect ChatBubble::bubble_rect() const {
    const Metrics m = measure(rect_.w);
    int x = rect_.x + kRowMarginX;
    if (own_) {
        x = rect_.x + rect_.w - kRowMarginX - m.bubble_w;
        if (show_avatar_) x -= kAvatarSize + kGap;
    } else if (show_avatar_) {
        x += kAvatarSize + kGap;
    }
    return SDL_Rect{ x, rect_.y + kRowMarginY + m.sender_h, m.bubble_w, m.bubble_h };
}

int ChatBubble::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 360;
}

int ChatBubble::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const Metrics m = measure(w);
    const int content = m.sender_h + m.bubble_h + m.time_h;
    return 2 * kRowMarginY + std::max(content, show_avatar_ ? kAvatarSize : 0);
}

void ChatBubble::layout() {
    const Metrics m = measure(rect_.w);
    // The avatar lines up with the bottom of the bubble.
    const int y = rect_.y + kRowMarginY + m.sender_h + std::max(0, m.bubble_h - kAvatarSize);
    const int x = own_ ? rect_.x + rect_.w - kRowMarginX - kAvatarSize : rect_.x + kRowMarginX;
    avatar_->set_rect(SDL_Rect{ x, y, kAvatarSize, kAvatarSize });
    avatar_->set_visible(show_avatar_);
}

bool ChatBubble::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    const SDL_Rect bubble = bubble_rect();
    track_hover(e, bubble);
    switch (click_.feed(e, bubble)) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        if (on_clicked_) on_clicked_();
        return true;
    default:
        return false;
    }
}

void ChatBubble::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Rect bubble = bubble_rect();
    const LabelStyle caption = Styles::Label("caption", "text_secondary");

    if (shows_sender()) {
        const SDL_Rect line{ bubble.x, bubble.y - wk_text::line_height(caption) - kLineGap,
                             std::max(bubble.w, max_bubble_width(rect_.w)), wk_text::line_height(caption) };
        wk_text::draw_in_rect(r, caption, wk_text::elide(caption, sender_, line.w), line, wk_text::Align::Left, alpha);
    }

    SDL_Color bg = own_ ? tm.color("primary") : tm.color("light");
    if (hovered_) bg = wk::darken(bg, 0.05f);
    wk_draw::fill_rounded_rect(r, bubble, 12, bg, alpha);
    const LabelStyle st = message_style(own_);
    wk_text::draw_wrapped(r, st, message_, bubble.x + kPadX, bubble.y + kPadY, bubble.w - 2 * kPadX, kLineGap, alpha);

    if (show_timestamp_) {
        const int h = wk_text::line_height(caption);
        const SDL_Rect line{ bubble.x, bubble.y + bubble.h + kLineGap, bubble.w, h };
        wk_text::draw_in_rect(r, caption, time_text(), line, own_ ? wk_text::Align::Right : wk_text::Align::Left,
                              alpha);
    }
    if (show_avatar_) avatar_->render(r);
}

TypingIndicator::TypingIndicator(const std::string& sender)
    : sender_(sender), avatar_(std::make_unique<UserAvatar>(sender, "", ChatBubble::kAvatarSize)) {
    avatar_->set_parent(this);
    timer_.set_on_timeout([this]() { active_dot_ = (active_dot_ + 1) % kDotCount; });
    start();
}

TypingIndicator::~TypingIndicator() = default;

void TypingIndicator::set_sender(const std::string& sender) {
    sender_ = sender;
    avatar_->set_name(sender);
}

void TypingIndicator::start() {
    active_dot_ = 0;
    timer_.start(kStepMs);
}

void TypingIndicator::stop() { timer_.stop(); }

void TypingIndicator::set_visible(bool v) {
    Widget::set_visible(v);
    if (v) {
        start();
    } else {
        stop();
    }
}

int TypingIndicator::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 2 * kRowMarginX + ChatBubble::kAvatarSize + kGap + kTypingWidth;
}

int TypingIndicator::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return 2 * kRowMarginY + std::max(ChatBubble::kAvatarSize, kTypingHeight);
}

void TypingIndicator::layout() {
    avatar_->set_rect(SDL_Rect{ rect_.x + kRowMarginX, rect_.y + kRowMarginY, ChatBubble::kAvatarSize,
                                ChatBubble::kAvatarSize });
}

void TypingIndicator::update() {
    if (visible_) timer_.poll();
}

void TypingIndicator::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    avatar_->render(r);
    const SDL_Rect bubble{ rect_.x + kRowMarginX + ChatBubble::kAvatarSize + kGap,
                           rect_.y + kRowMarginY + (ChatBubble::kAvatarSize - kTypingHeight) / 2, kTypingWidth,
                           kTypingHeight };
    wk_draw::fill_rounded_rect(r, bubble, 12, tm.color("light"), alpha);
    const int step = (kTypingWidth - 24) / (kDotCount - 1);
    for (int i = 0; i < kDotCount; ++i) {
        const SDL_Color c = i == active_dot_ ? tm.color("primary") : tm.color("text_secondary");
        wk_draw::fill_circle(r, bubble.x + 12 + i * step, bubble.y + bubble.h / 2, kDotRadius, c, alpha);
    }
}

ChatContainer::ChatContainer() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0)) {
    layout_->set_parent(this);

    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4);
    list->set_margins(0, 8, 0, 8);
    list_ = list.get();
    typing_ = list_->add_widget(std::make_unique<TypingIndicator>());
    typing_->hide();
    auto scroll = std::make_unique<ScrollArea>(std::move(list));
    scroll->set_follow_bottom(true);
    scroll_ = layout_->add_widget(std::move(scroll), 1);

    layout_->add_widget(std::make_unique<Separator>());
    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    row->set_margins(8);
    row->set_alignment(BoxLayout::Align::Center);
    input_ = row->add_widget(std::make_unique<TextBox>("", "Type a message..."), 1);
    input_->set_on_submitted([this](const std::string&) { send_message(); });
    send_button_ = row->add_widget(std::make_unique<BaseButton>("Send", ButtonVariant::Primary, ButtonSize::Medium));
    send_button_->set_on_clicked([this]() { send_message(); });
    layout_->add_widget(std::move(row));
}

ChatContainer::~ChatContainer() = default;

ChatBubble* ChatContainer::add_message(const std::string& message, const std::string& sender, bool is_own,
                                       std::time_t timestamp, const std::string& avatar_path) {
    auto bubble = std::make_unique<ChatBubble>(message, sender, timestamp, is_own, avatar_path);
    auto* raw = static_cast<ChatBubble*>(list_->insert(list_->count() - 1, std::move(bubble)));
    messages_.push_back(raw);
    layout();
    scroll_->scroll_to_bottom();
    return raw;
}

void ChatContainer::send_message() {
    const std::string text = wk_text::trim(input_->text());
    if (text.empty()) return;
    add_message(text, "You", true);
    input_->clear();
    if (on_message_sent_) on_message_sent_(text);
}

void ChatContainer::show_typing(bool show, const std::string& sender) {
    if (show) typing_->set_sender(sender);
    typing_->set_visible(show);
    layout();
    if (show) scroll_->scroll_to_bottom();
}

bool ChatContainer::is_typing_shown() const { return typing_->is_visible(); }

void ChatContainer::clear() {
    for (ChatBubble* bubble : messages_) list_->remove(bubble);
    messages_.clear();
    layout();
}

ChatBubble* ChatContainer::message(int i) const {
    if (i < 0 || i >= message_count()) return nullptr;
    return messages_[static_cast<size_t>(i)];
}

int ChatContainer::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 420;
}

int ChatContainer::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return 480;
}

void ChatContainer::layout() { layout_->set_rect(rect_); }

bool ChatContainer::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void ChatContainer::update() { layout_->update(); }

void ChatContainer::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::ClipScope clip(r, rect_);
    layout_->render(r);
}
