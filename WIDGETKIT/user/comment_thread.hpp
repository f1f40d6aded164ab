#pragma once

#include <SDL.h>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class Label;
class ScrollArea;
class TextBox;
class UserAvatar;

// One comment: avatar, author, relative time, the text and a row with
// Like, Reply, Edit and Delete. Edit swaps the text for an inline editor.
class CommentItem : public Widget {
public:
    static constexpr int kAvatarSize = 32;

    CommentItem(const std::string& id, const std::string& author, const std::string& content,
                std::time_t timestamp = 0, const std::string& avatar_path = {}, int likes = 0);
    ~CommentItem() override;

    // "just now", "5m ago", "3h ago", "2d ago".
    static std::string relative_time(std::time_t timestamp, std::time_t now);

    const std::string& id() const { return id_; }
    const std::string& author() const { return author_; }
    const std::string& content() const { return content_; }
    void set_content(const std::string& content);
    std::time_t timestamp() const { return timestamp_; }
    std::string time_text() const;
    int likes() const { return likes_; }
    bool is_liked() const { return liked_; }
    void toggle_like();

    void start_edit();
    // Empty text after trimming keeps the edit open.
    bool save_edit();
    void cancel_edit();
    bool is_editing() const { return editing_; }

    // Left indent for nested replies.
    void set_indent(int px);
    int indent() const { return indent_; }

    TextBox* editor() const { return editor_; }
    BaseButton* like_button() const { return like_button_; }
    BaseButton* reply_button() const { return reply_button_; }
    BaseButton* edit_button() const { return edit_button_; }
    BaseButton* delete_button() const { return delete_button_; }

    void set_on_like_toggled(std::function<void(bool)> cb) { on_like_toggled_ = std::move(cb); }
    void set_on_reply(std::function<void()> cb) { on_reply_ = std::move(cb); }
    void set_on_edited(std::function<void(const std::string&)> cb) { on_edited_ = std::move(cb); }
    void set_on_delete(std::function<void()> cb) { on_delete_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void refresh_like();
    void end_edit();

    std::string id_;
    std::string author_;
    std::string content_;
    std::time_t timestamp_;
    int likes_;
    bool liked_ = false;
    bool editing_ = false;
    int indent_ = 0;
    std::unique_ptr<BoxLayout> layout_;
    UserAvatar* avatar_ = nullptr;
    Label* time_label_ = nullptr;
    Label* content_label_ = nullptr;
    BoxLayout* edit_row_ = nullptr;
    TextBox* editor_ = nullptr;
    BaseButton* like_button_ = nullptr;
    BaseButton* reply_button_ = nullptr;
    BaseButton* edit_button_ = nullptr;
    BaseButton* delete_button_ = nullptr;
    std::function<void(bool)> on_like_toggled_{};
    std::function<void()> on_reply_{};
    std::function<void(const std::string&)> on_edited_{};
    std::function<void()> on_delete_{};
};

// Multiline input with Cancel and a post button.
class CommentForm : public Widget {
public:
    explicit CommentForm(const std::string& post_text = "Post Comment",
                         const std::string& placeholder = "Write a comment...");
    ~CommentForm() override;

    TextBox* input() const { return input_; }
    BaseButton* post_button() const { return post_button_; }
    BaseButton* cancel_button() const { return cancel_button_; }
    void set_indent(int px);

    void set_on_post(std::function<void(const std::string&)> cb) { on_post_ = std::move(cb); }
    void set_on_cancel(std::function<void()> cb) { on_cancel_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::unique_ptr<BoxLayout> layout_;
    TextBox* input_ = nullptr;
    BaseButton* cancel_button_ = nullptr;
    BaseButton* post_button_ = nullptr;
    std::function<void(const std::string&)> on_post_{};
    std::function<void()> on_cancel_{};
};

// Threaded comments. Replies are indented 30 px per level under their
// parent. Changes started from a button inside the list are applied on the
// next update().
class CommentThread : public Widget {
public:
    static constexpr int kIndentStep = 30;
    static constexpr const char* kRootId = "root";
    static constexpr const char* kCurrentUser = "Current User";

    CommentThread();
    ~CommentThread() override;

    // Empty parent_id adds a top-level comment. Returns the new id, or an
    // empty string when the parent does not exist.
    std::string add_comment(const std::string& author, const std::string& content,
                            const std::string& parent_id = {}, std::time_t timestamp = 0,
                            const std::string& avatar_path = {});
    std::string add_reply(const std::string& parent_id, const std::string& author, const std::string& content,
                          std::time_t timestamp = 0, const std::string& avatar_path = {});
    // Posts as the current user and emits comment_added.
    std::string post_comment(const std::string& content, const std::string& parent_id = {});
    // Removes the comment and all of its replies.
    bool delete_comment(const std::string& id);
    void clear_comments();

    int comment_count() const { return static_cast<int>(nodes_.size()); }
    std::string count_text() const;
    CommentItem* comment(const std::string& id) const;
    std::vector<std::string> replies(const std::string& id) const;
    // Ids in display order.
    std::vector<std::string> ordered_ids() const;
    int depth(const std::string& id) const;

    void show_reply_form(const std::string& parent_id);
    void hide_reply_form();
    const std::string& reply_target() const { return reply_to_; }
    CommentForm* reply_form() const { return reply_form_; }
    CommentForm* form() const { return form_; }

    void set_on_comment_added(std::function<void(const std::string&, const std::string&)> cb) {
        on_comment_added_ = std::move(cb);
    }
    void set_on_comment_edited(std::function<void(const std::string&, const std::string&)> cb) {
        on_comment_edited_ = std::move(cb);
    }
    void set_on_comment_deleted(std::function<void(const std::string&)> cb) { on_comment_deleted_ = std::move(cb); }
    void set_on_comment_liked(std::function<void(const std::string&, bool)> cb) { on_comment_liked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Node {
        std::string parent;
        CommentItem* item = nullptr;
    };

    CommentItem* create_item(const std::string& id, const std::string& author, const std::string& content,
                             std::time_t timestamp, const std::string& avatar_path);
    void erase_subtree(const std::string& id, std::vector<std::string>& removed);
    void append_ordered(const std::string& parent, std::vector<std::string>& out) const;
    void rebuild();
    void refresh_count();
    void defer(std::function<void()> fn) { deferred_.push_back(std::move(fn)); }

    std::unique_ptr<BoxLayout> layout_;
    Label* count_label_ = nullptr;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* list_ = nullptr;
    CommentForm* form_ = nullptr;
    CommentForm* reply_form_ = nullptr;
    std::string reply_to_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::vector<std::string>> children_;
    // Owned widgets that are not in the list: new items and the idle reply form.
    std::vector<std::unique_ptr<Widget>> pending_;
    std::vector<std::function<void()>> deferred_;
    int next_id_ = 0;
    std::function<void(const std::string&, const std::string&)> on_comment_added_{};
    std::function<void(const std::string&, const std::string&)> on_comment_edited_{};
    std::function<void(const std::string&)> on_comment_deleted_{};
    std::function<void(const std::string&, bool)> on_comment_liked_{};
};
