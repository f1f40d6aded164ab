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
class ContextMenuPopup;
class Label;
class ScrollArea;
class TextBox;

struct ClipboardEntry {
    std::string content;
    // "text" for captured clipboard text, "manual" for add_manual_item().
    std::string type = "text";
    std::time_t timestamp = 0;
    bool pinned = false;
};

// One history entry: a single-line preview over the type and the time it
// was captured. A pin icon marks pinned entries.
class ClipboardRow : public Widget {
public:
    explicit ClipboardRow(const ClipboardEntry& entry);
    ~ClipboardRow() override;

    const std::string& content() const { return content_; }
    bool is_pinned() const { return pinned_; }

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }
    void set_on_context_menu(std::function<void(int, int)> cb) { on_context_menu_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::string content_;
    bool pinned_;
    std::unique_ptr<BoxLayout> layout_;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
    std::function<void(int, int)> on_context_menu_{};
};

// Most-recent-first list of clipboard texts. While monitoring, the system
// clipboard is checked once a second and new text is added to the top.
// Clicking an entry copies it back to the clipboard.
class ClipboardHistory : public Widget {
public:
    static constexpr Uint32 kPollMs = 1000;
    static constexpr size_t kPreviewLength = 100;

    explicit ClipboardHistory(int max_items = 50);
    ~ClipboardHistory() override;

    // First 100 code points with newlines shown as " ↵ ".
    static std::string preview(const std::string& content);
    // Newlines replaced by spaces, trimmed.
    static std::string plain_text(const std::string& content);
    static std::string time_text(std::time_t t);

    // Trims the text; empty text is ignored and a duplicate moves to the top.
    // Returns false when nothing was added.
    bool add_item(const std::string& content, const std::string& type = "text");
    bool add_manual_item(const std::string& content) { return add_item(content, "manual"); }
    const std::vector<ClipboardEntry>& items() const { return items_; }
    int item_count() const { return static_cast<int>(items_.size()); }
    bool remove_item(int index);
    // Keeps pinned entries.
    void clear_history();

    bool set_pinned(int index, bool pinned);
    bool toggle_pin(int index);

    // Drops the oldest unpinned entries beyond the limit.
    void set_max_items(int max_items);
    int max_items() const { return max_items_; }

    // Puts the entry on the system clipboard and emits item_copied.
    bool copy_item(int index);
    bool copy_as_plain_text(int index);

    // Case-insensitive substring filter over the contents.
    void set_filter(const std::string& query);
    const std::string& filter_text() const { return filter_; }
    // Indices into items() of the entries currently listed.
    const std::vector<int>& visible_items() const { return visible_rows_; }
    ClipboardRow* row(int visible_index) const;

    void set_monitoring(bool on);
    bool is_monitoring() const { return monitoring_; }
    // Reads the system clipboard now. Returns true when an entry was added.
    bool check_clipboard();

    void show_context_menu(int index, int x, int y);
    ContextMenuPopup* context_menu() const { return menu_.get(); }

    TextBox* search_box() const { return search_; }
    BaseButton* clear_button() const { return clear_button_; }
    BaseButton* monitor_button() const { return monitor_button_; }
    const std::string& status_text() const;

    void set_on_item_selected(std::function<void(const std::string&)> cb) { on_item_selected_ = std::move(cb); }
    void set_on_item_copied(std::function<void(const std::string&)> cb) { on_item_copied_ = std::move(cb); }
    void set_on_history_cleared(std::function<void()> cb) { on_history_cleared_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void enforce_limit();
    void rebuild();
    bool put_on_clipboard(const std::string& text);

    int max_items_;
    std::vector<ClipboardEntry> items_;
    std::vector<int> visible_rows_;
    std::vector<ClipboardRow*> rows_;
    std::string filter_;
    std::string last_seen_;
    bool monitoring_ = true;
    Timer poll_timer_{ false };
    std::unique_ptr<BoxLayout> layout_;
    TextBox* search_ = nullptr;
    BaseButton* clear_button_ = nullptr;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* list_ = nullptr;
    Label* status_label_ = nullptr;
    BaseButton* monitor_button_ = nullptr;
    std::unique_ptr<ContextMenuPopup> menu_;
    std::function<void(const std::string&)> on_item_selected_{};
    std::function<void(const std::string&)> on_item_copied_{};
    std::function<void()> on_history_cleared_{};
};
