#include "comment_thread.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"
#include "user/user_avatar.hpp"

namespace {
constexpr int kPadX = 12;
constexpr int kPadY = 8;
constexpr int kThreadWidth = 420;
constexpr int kThreadHeight = 480;
constexpr int kMinute = 60;
constexpr int kHour = 3600;
constexpr int kDay = 86400;
}

CommentItem::CommentItem(const std::string& id, const std::string& author, const std::string& content,
                         std::time_t timestamp, const std::string& avatar_path, int likes)
    : id_(id),
      author_(author),
      content_(content),
      timestamp_(timestamp != 0 ? timestamp : std::time(nullptr)),
      likes_(std::max(0, likes)),
      layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12)) {
    layout_->set_parent(this);
    layout_->set_margins(kPadX, kPadY, kPadX, kPadY);
    layout_->set_alignment(BoxLayout::Align::Start);
    avatar_ = layout_->add_widget(std::make_unique<UserAvatar>(author, avatar_path, kAvatarSize));

    auto column = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4);
    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_alignment(BoxLayout::Align::Center);
    auto* name = header->add_widget(std::make_unique<Label>(author, "default", "text"));
    name->set_bold(true);
    time_label_ = header->add_widget(std::make_unique<Label>(time_text(), "caption", "text_secondary"));
    header->add_stretch();
    column->add_widget(std::move(header));

    content_label_ = column->add_widget(std::make_unique<Label>(content, "default", "text"));
    content_label_->set_word_wrap(true);

    auto edit_row = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4);
    editor_ = edit_row->add_widget(std::make_unique<TextBox>(content, "", true));
    auto edit_buttons = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 4);
    auto* save = edit_buttons->add_widget(std::make_unique<BaseButton>("Save", ButtonVariant::Primary, ButtonSize::Small));
    save->set_on_clicked([this]() { save_edit(); });
    auto* cancel = edit_buttons->add_widget(std::make_unique<BaseButton>("Cancel", ButtonVariant::Ghost, ButtonSize::Small));
    cancel->set_on_clicked([this]() { cancel_edit(); });
    edit_buttons->add_stretch();
    edit_row->add_widget(std::move(edit_buttons));
    edit_row_ = column->add_widget(std::move(edit_row));
    edit_row_->hide();

    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 4);
    like_button_ = actions->add_widget(std::make_unique<BaseButton>("", ButtonVariant::Ghost, ButtonSize::Small));
    like_button_->set_on_clicked([this]() { toggle_like(); });
    reply_button_ = actions->add_widget(std::make_unique<BaseButton>("Reply", ButtonVariant::Ghost, ButtonSize::Small));
    reply_button_->set_on_clicked([this]() {
        if (on_reply_) on_reply_();
    });
    edit_button_ = actions->add_widget(std::make_unique<BaseButton>("Edit", ButtonVariant::Ghost, ButtonSize::Small));
    edit_button_->set_on_clicked([this]() {
        if (editing_) cancel_edit(); else start_edit();
    });
    delete_button_ = actions->add_widget(std::make_unique<BaseButton>("Delete", ButtonVariant::Ghost, ButtonSize::Small));
    delete_button_->set_on_clicked([this]() {
        if (on_delete_) on_delete_();
    });
    actions->add_stretch();
    column->add_widget(std::move(actions));
    layout_->add_widget(std::move(column), 1);
    refresh_like();
}

CommentItem::~CommentItem() = default;

std::string CommentItem::relative_time(std::time_t timestamp, std::time_t now) {
    const long seconds = static_cast<long>(std::difftime(now, timestamp));
    if (seconds < kMinute) return "just now";
    if (seconds < kHour) return std::to_string(seconds / kMinute) + "m ago";
    if (seconds < kDay) return std::to_string(seconds / kHour) + "h ago";
    return std::to_string(seconds / kDay) + "d ago";
}

std::string CommentItem::time_text() const { return relative_time(timestamp_, std::time(nullptr)); }

void CommentItem::set_content(const std::string& content) {
    content_ = content;
    content_label_->set_text(content);
    layout();
}

void CommentItem::refresh_like() {
    like_button_->set_text("👍 " + std::to_string(likes_));
    like_button_->set_variant(liked_ ? ButtonVariant::Primary : ButtonVariant::Ghost);
}

void CommentItem::toggle_like() {
    liked_ = !liked_;
    likes_ = liked_ ? likes_ + 1 : std::max(0, likes_ - 1);
    refresh_like();
    if (on_like_toggled_) on_like_toggled_(liked_);
}

void CommentItem::start_edit() {
    if (editing_) return;
    editing_ = true;
    editor_->set_text(content_);
    content_label_->hide();
    edit_row_->show();
    editor_->set_focus(true);
    edit_button_->set_text("Cancel");
    layout();
}

bool CommentItem::save_edit() {
    if (!editing_) return false;
    const std::string text = wk_text::trim(editor_->text());
    if (text.empty()) return false;
    set_content(text);
    end_edit();
    if (on_edited_) on_edited_(content_);
    return true;
}

void CommentItem::cancel_edit() {
    if (editing_) end_edit();
}

void CommentItem::end_edit() {
    editing_ = false;
    editor_->set_focus(false);
    edit_row_->hide();
    content_label_->show();
    edit_button_->set_text("Edit");
    layout();
}

void CommentItem::set_indent(int px) {
    indent_ = std::max(0, px);
    layout_->set_margins(kPadX + indent_, kPadY, kPadX, kPadY);
    layout();
}

int CommentItem::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int CommentItem::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void CommentItem::layout() { layout_->set_rect(rect_); }

bool CommentItem::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void CommentItem::update() {
    time_label_->set_text(time_text());
    layout_->update();
}

void CommentItem::render(SDL_Renderer* r) const {
    if (!visible_) return;
    if (indent_ > 0) {
        const auto& tm = ThemeManager::instance();
        const int x = rect_.x + indent_ - kPadX / 2;
        wk_draw::fill_rect(r, SDL_Rect{ x, rect_.y, 2, rect_.h }, tm.color("border"), effective_opacity());
    }
    layout_->render(r);
}

CommentForm::CommentForm(const std::string& post_text, const std::string& placeholder)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
    layout_->set_margins(kPadX, kPadY, kPadX, kPadY);
    input_ = layout_->add_widget(std::make_unique<TextBox>("", placeholder, true));
    input_->set_visible_rows(3);

    auto buttons = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    buttons->add_stretch();
    cancel_button_ = buttons->add_widget(std::make_unique<BaseButton>("Cancel", ButtonVariant::Ghost, ButtonSize::Small));
    cancel_button_->set_on_clicked([this]() {
        input_->clear();
        if (on_cancel_) on_cancel_();
    });
    post_button_ = buttons->add_widget(std::make_unique<BaseButton>(post_text, ButtonVariant::Primary, ButtonSize::Small));
    post_button_->set_on_clicked([this]() {
        const std::string text = wk_text::trim(input_->text());
        if (text.empty()) return;
        input_->clear();
        if (on_post_) on_post_(text);
    });
    layout_->add_widget(std::move(buttons));
}

CommentForm::~CommentForm() = default;

void CommentForm::set_indent(int px) {
    layout_->set_margins(kPadX + std::max(0, px), kPadY, kPadX, kPadY);
    layout();
}

int CommentForm::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int CommentForm::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void CommentForm::layout() { layout_->set_rect(rect_); }

bool CommentForm::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void CommentForm::update() { layout_->update(); }

void CommentForm::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}

CommentThread::CommentThread() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0)) {
    layout_->set_parent(this);

    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_margins(kPadX, kPadY, kPadX, kPadY);
    header->set_alignment(BoxLayout::Align::Center);
    auto* title = header->add_widget(std::make_unique<Label>("Comments", "heading", "text"));
    title->set_bold(true);
    header->add_stretch();
    count_label_ = header->add_widget(std::make_unique<Label>("", "caption", "text_secondary"));
    layout_->add_widget(std::move(header));
    layout_->add_widget(std::make_unique<Separator>());

    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    list_ = list.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(list)), 1);
    layout_->add_widget(std::make_unique<Separator>());

    form_ = layout_->add_widget(std::make_unique<CommentForm>());
    form_->set_on_post([this](const std::string& text) { post_comment(text); });

    auto reply = std::make_unique<CommentForm>("Reply", "Write a reply...");
    reply_form_ = reply.get();
    reply_form_->set_on_post([this](const std::string& text) {
        const std::string target = reply_to_;
        defer([this, target, text]() {
            hide_reply_form();
            if (nodes_.count(target) != 0) post_comment(text, target);
        });
    });
    reply_form_->set_on_cancel([this]() { defer([this]() { hide_reply_form(); }); });
    pending_.push_back(std::move(reply));
    refresh_count();
}

CommentThread::~CommentThread() = default;

CommentItem* CommentThread::create_item(const std::string& id, const std::string& author, const std::string& content,
                                        std::time_t timestamp, const std::string& avatar_path) {
    auto item = std::make_unique<CommentItem>(id, author, content, timestamp, avatar_path);
    CommentItem* raw = item.get();
    raw->set_on_like_toggled([this, id](bool liked) {
        if (on_comment_liked_) on_comment_liked_(id, liked);
    });
    raw->set_on_reply([this, id]() { defer([this, id]() { show_reply_form(id); }); });
    raw->set_on_edited([this, id](const std::string& text) {
        if (on_comment_edited_) on_comment_edited_(id, text);
    });
    raw->set_on_delete([this, id]() { defer([this, id]() { delete_comment(id); }); });
    pending_.push_back(std::move(item));
    return raw;
}

std::string CommentThread::add_comment(const std::string& author, const std::string& content,
                                       const std::string& parent_id, std::time_t timestamp,
                                       const std::string& avatar_path) {
    if (!parent_id.empty() && nodes_.count(parent_id) == 0) return {};
    const std::string id = std::to_string(next_id_++);
    Node node;
    node.parent = parent_id.empty() ? kRootId : parent_id;
    node.item = create_item(id, author, content, timestamp, avatar_path);
    children_[node.parent].push_back(id);
    nodes_.emplace(id, node);
    rebuild();
    refresh_count();
    return id;
}

std::string CommentThread::add_reply(const std::string& parent_id, const std::string& author,
                                     const std::string& content, std::time_t timestamp,
                                     const std::string& avatar_path) {
    if (parent_id.empty()) return {};
    return add_comment(author, content, parent_id, timestamp, avatar_path);
}

std::string CommentThread::post_comment(const std::string& content, const std::string& parent_id) {
    const std::string text = wk_text::trim(content);
    if (text.empty()) return {};
    const std::string id = add_comment(kCurrentUser, text, parent_id);
    if (id.empty()) return id;
    scroll_->ensure_visible(nodes_[id].item->rect());
    if (on_comment_added_) on_comment_added_(parent_id.empty() ? kRootId : parent_id, text);
    return id;
}

void CommentThread::erase_subtree(const std::string& id, std::vector<std::string>& removed) {
    auto kids = children_.find(id);
    if (kids != children_.end()) {
        const std::vector<std::string> copy = kids->second;
        for (const std::string& child : copy) erase_subtree(child, removed);
        children_.erase(id);
    }
    if (reply_to_ == id) reply_to_.clear();
    nodes_.erase(id);
    removed.push_back(id);
}

bool CommentThread::delete_comment(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    std::vector<std::string>& siblings = children_[it->second.parent];
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    std::vector<std::string> removed;
    erase_subtree(id, removed);
    rebuild();
    refresh_count();
    if (on_comment_deleted_) {
        for (const std::string& gone : removed) on_comment_deleted_(gone);
    }
    return true;
}

void CommentThread::clear_comments() {
    nodes_.clear();
    children_.clear();
    reply_to_.clear();
    deferred_.clear();
    rebuild();
    scroll_->scroll_to_top();
    refresh_count();
}

std::string CommentThread::count_text() const {
    const int n = comment_count();
    return std::to_string(n) + (n == 1 ? " comment" : " comments");
}

void CommentThread::refresh_count() { count_label_->set_text(count_text()); }

CommentItem* CommentThread::comment(const std::string& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.item;
}

std::vector<std::string> CommentThread::replies(const std::string& id) const {
    auto it = children_.find(id);
    return it == children_.end() ? std::vector<std::string>() : it->second;
}

void CommentThread::append_ordered(const std::string& parent, std::vector<std::string>& out) const {
    auto it = children_.find(parent);
    if (it == children_.end()) return;
    for (const std::string& id : it->second) {
        out.push_back(id);
        append_ordered(id, out);
    }
}

std::vector<std::string> CommentThread::ordered_ids() const {
    std::vector<std::string> out;
    append_ordered(kRootId, out);
    return out;
}

int CommentThread::depth(const std::string& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return -1;
    int d = 0;
    while (it->second.parent != kRootId) {
        it = nodes_.find(it->second.parent);
        if (it == nodes_.end()) break;
        ++d;
    }
    return d;
}

void CommentThread::show_reply_form(const std::string& parent_id) {
    if (nodes_.count(parent_id) == 0) return;
    reply_to_ = parent_id;
    reply_form_->input()->clear();
    rebuild();
    reply_form_->input()->set_focus(true);
    scroll_->ensure_visible(reply_form_->rect());
}

void CommentThread::hide_reply_form() {
    if (reply_to_.empty()) return;
    reply_to_.clear();
    reply_form_->input()->set_focus(false);
    rebuild();
}

// Puts the items back into the list in thread order. Widgets of deleted
// comments are destroyed here.
void CommentThread::rebuild() {
    std::map<Widget*, std::unique_ptr<Widget>> pool;
    for (auto& w : pending_) {
        Widget* raw = w.get();
        pool[raw] = std::move(w);
    }
    pending_.clear();
    while (list_->count() > 0) {
        std::unique_ptr<Widget> w = list_->take(list_->at(0));
        Widget* raw = w.get();
        pool[raw] = std::move(w);
    }

    for (const std::string& id : ordered_ids()) {
        CommentItem* item = nodes_[id].item;
        const int indent = depth(id) * kIndentStep;
        item->set_indent(indent);
        list_->add(std::move(pool[item]));
        pool.erase(item);
        if (id == reply_to_) {
            reply_form_->set_indent(indent + kIndentStep);
            list_->add(std::move(pool[reply_form_]));
            pool.erase(reply_form_);
        }
    }
    auto parked = pool.find(reply_form_);
    if (parked != pool.end()) pending_.push_back(std::move(parked->second));
    layout();
}

int CommentThread::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return kThreadWidth;
}

int CommentThread::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kThreadHeight;
}

void CommentThread::layout() { layout_->set_rect(rect_); }

bool CommentThread::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void CommentThread::update() {
    std::vector<std::function<void()>> work;
    work.swap(deferred_);
    for (auto& fn : work) fn();
    layout_->update();
}

void CommentThread::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::draw_rect(r, rect_, tm.color("border"), alpha);
    wk_draw::ClipScope clip(r, rect_);
    layout_->render(r);
}
