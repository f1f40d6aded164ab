#pragma once

#include <SDL.h>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class ScrollArea;
class TextBox;
class UserAvatar;

// One chat message. Own messages sit on the right in the primary colour,
// others on the left on a light bubble with the sender's name above. The
// bubble is never wider than 70% of the row.
class ChatBubble : public Widget {
public:
    static constexpr int kAvatarSize = 32;
    static constexpr int kPadX = 12;
    static constexpr int kPadY = 8;
    static constexpr float kMaxWidthRatio = 0.7f;

    // `timestamp` 0 means now.
    explicit ChatBubble(const std::string& message, const std::string& sender = {}, std::time_t timestamp = 0,
                        bool is_own = false, const std::string& avatar_path = {});
    ~ChatBubble() override;

    void set_message(const std::string& m) { message_ = m; }
    const std::string& message() const { return message_; }
    const std::string& sender() const { return sender_; }
    bool is_own() const { return own_; }
    void set_timestamp(std::time_t t) { timestamp_ = t; }
    std::time_t timestamp() const { return timestamp_; }
    // "HH:MM", local time.
    std::string time_text() const;

    void set_show_avatar(bool show) { show_avatar_ = show; }
    void set_show_timestamp(bool show) { show_timestamp_ = show; }
    const UserAvatar* avatar() const { return avatar_.get(); }

    SDL_Rect bubble_rect() const;
    // Widest bubble for a row of width `w`.
    static int max_bubble_width(int w) { return static_cast<int>(w * kMaxWidthRatio); }

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Metrics {
        int sender_h = 0;
        int bubble_w = 0;
        int bubble_h = 0;
        int time_h = 0;
    };
    Metrics measure(int w) const;
    bool shows_sender() const { return !own_ && !sender_.empty(); }

    std::string message_;
    std::string sender_;
    std::time_t timestamp_;
    bool own_;
    bool show_avatar_ = true;
    bool show_timestamp_ = true;
    std::unique_ptr<UserAvatar> avatar_;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
};

// "Someone is typing" bubble; the highlighted dot moves every 500 ms.
class TypingIndicator : public Widget {
public:
    static constexpr Uint32 kStepMs = 500;
    static constexpr int kDotCount = 3;

    explicit TypingIndicator(const std::string& sender = {});
    ~TypingIndicator() override;

    void set_sender(const std::string& sender);
    const std::string& sender() const { return sender_; }
    void start();
    void stop();
    bool is_animating() const { return timer_.is_active(); }
    int active_dot() const { return active_dot_; }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void set_visible(bool v) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::string sender_;
    std::unique_ptr<UserAvatar> avatar_;
    Timer timer_{false};
    int active_dot_ = 0;
};

// Scrolling list of bubbles with a message box and a Send button.
class ChatContainer : public Widget {
public:
    ChatContainer();
    ~ChatContainer() override;

    ChatBubble* add_message(const std::string& message, const std::string& sender = {}, bool is_own = false,
                            std::time_t timestamp = 0, const std::string& avatar_path = {});
    // Sends the text in the message box as the local user.
    void send_message();
    void show_typing(bool show, const std::string& sender = {});
    bool is_typing_shown() const;
    void clear();

    int message_count() const { return static_cast<int>(messages_.size()); }
    ChatBubble* message(int i) const;
    TextBox* input() const { return input_; }
    BaseButton* send_button() const { return send_button_; }
    ScrollArea* scroll_area() const { return scroll_; }

    void set_on_message_sent(std::function<void(const std::string&)> cb) { on_message_sent_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::unique_ptr<BoxLayout> layout_;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* list_ = nullptr;
    TypingIndicator* typing_ = nullptr;
    TextBox* input_ = nullptr;
    BaseButton* send_button_ = nullptr;
    std::vector<ChatBubble*> messages_;
    std::function<void(const std::string&)> on_message_sent_{};
};
