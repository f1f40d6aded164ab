#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/widget.hpp"

class Dropdown;
class TextBox;

// Scrollable list shown on the overlay layer under a search field. Header rows
// are drawn bold and skipped by the keyboard highlight.
class SuggestionList : public Widget {
public:
    static constexpr int kItemHeight = 32;
    static constexpr int kMaxHeight = 200;

    struct Row {
        std::string text;
        bool header = false;
    };

    SuggestionList() = default;
    ~SuggestionList() override;

    void set_rows(const std::vector<Row>& rows);
    void set_items(const std::vector<std::string>& items);
    const std::vector<Row>& rows() const { return rows_; }
    size_t selectable_count() const;

    // Moves the highlight by `delta` selectable rows, wrapping at the ends.
    void move_highlight(int delta);
    void set_highlighted(int row);
    int highlighted() const { return highlighted_; }
    // Runs the chosen callback for the highlighted row. Returns false when
    // nothing is highlighted.
    bool choose_highlighted();

    // Opens the list under `anchor` as a passive overlay.
    void open_below(const SDL_Rect& anchor);
    void close();
    bool is_open() const;
    int visible_rows() const;
    int first_visible() const { return first_; }
    SDL_Rect row_rect(int row) const;

    void set_on_chosen(std::function<void(int)> cb) { on_chosen_ = std::move(cb); }

    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    int row_at(SDL_Point p) const;
    void scroll_to(int row);

    std::vector<Row> rows_;
    int highlighted_ = -1;
    int first_ = 0;
    std::function<void(int)> on_chosen_{};
};

// Search field with a filtered suggestion list. Typing filters the
// suggestions (case-insensitive substring, at most max_suggestions) and starts
// a 300 ms debounce after which search_requested fires. Up/Down move through
// the list, Enter picks the highlighted suggestion or searches, Escape closes
// the list.
class SearchBoxWithSuggestions : public Widget {
public:
    static constexpr size_t kDefaultMaxSuggestions = 10;
    static constexpr size_t kDefaultMinChars = 1;
    static constexpr Uint32 kDefaultDelayMs = 300;

    explicit SearchBoxWithSuggestions(const std::string& placeholder = "Search...");
    ~SearchBoxWithSuggestions() override;

    void set_suggestions(const std::vector<std::string>& s);
    void add_suggestion(const std::string& s);
    void clear_suggestions();
    const std::vector<std::string>& suggestions() const { return suggestions_; }
    // Suggestions currently listed, without header rows.
    const std::vector<std::string>& filtered_suggestions() const { return filtered_; }

    void set_max_suggestions(size_t n) { max_suggestions_ = n; }
    size_t max_suggestions() const { return max_suggestions_; }
    void set_min_chars(size_t n) { min_chars_ = n; }
    size_t min_chars() const { return min_chars_; }
    void set_search_delay(Uint32 ms) { delay_ms_ = ms; }
    Uint32 search_delay() const { return delay_ms_; }
    void set_placeholder(const std::string& p);

    // Does not refilter or open the list.
    void set_text(const std::string& t);
    const std::string& text() const;
    void clear();

    // Runs a search for the current text now.
    void search();
    void select_suggestion(size_t index);
    bool is_list_open() const;
    TextBox* input() const { return input_.get(); }
    SuggestionList* list() const { return list_.get(); }

    void set_on_text_changed(std::function<void(const std::string&)> cb) { on_text_changed_ = std::move(cb); }
    void set_on_search_requested(std::function<void(const std::string&)> cb) { on_search_requested_ = std::move(cb); }
    void set_on_suggestion_selected(std::function<void(const std::string&)> cb) {
        on_suggestion_selected_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    // Matches for `query`; the default filters suggestions().
    virtual std::vector<std::string> compute_matches(const std::string& query) const;
    // Rows to show for an empty query; none by default.
    virtual std::vector<SuggestionList::Row> idle_rows() const { return {}; }
    virtual void on_search(const std::string& query) { (void)query; }
    void refresh();
    void show_rows(const std::vector<SuggestionList::Row>& rows);

    std::vector<std::string> suggestions_;
    std::vector<std::string> filtered_;
    std::unique_ptr<TextBox> input_;

private:
    void text_edited(const std::string& t);
    void row_chosen(int row);
    void emit_search(const std::string& query);

    std::unique_ptr<SuggestionList> list_;
    std::vector<SuggestionList::Row> shown_;
    size_t max_suggestions_ = kDefaultMaxSuggestions;
    size_t min_chars_ = kDefaultMinChars;
    Uint32 delay_ms_ = kDefaultDelayMs;
    bool suppress_ = false;
    Timer debounce_{ true };
    std::function<void(const std::string&)> on_text_changed_{};
    std::function<void(const std::string&)> on_search_requested_{};
    std::function<void(const std::string&)> on_suggestion_selected_{};
};

// Remembers the last five searches and lists them while the field is empty.
class RecentSearchBox : public SearchBoxWithSuggestions {
public:
    static constexpr size_t kMaxRecent = 5;

    explicit RecentSearchBox(const std::string& placeholder = "Search...");

    const std::vector<std::string>& recent_searches() const { return recent_; }
    void clear_recent_searches() { recent_.clear(); }
    // Shows the recent list under the field.
    void show_recent();

protected:
    std::vector<SuggestionList::Row> idle_rows() const override;
    void on_search(const std::string& query) override;

private:
    std::vector<std::string> recent_;
};

// Keeps up to twenty past searches, most recent first.
class HistorySearchBox : public SearchBoxWithSuggestions {
public:
    static constexpr size_t kMaxHistory = 20;

    explicit HistorySearchBox(const std::string& placeholder = "Search...");

    const std::vector<std::string>& history() const { return history_; }
    void clear_history() { history_.clear(); }
    // Keeps the first twenty entries.
    void load_history(const std::vector<std::string>& history);

protected:
    void on_search(const std::string& query) override;

private:
    std::vector<std::string> history_;
};

// Suggestions grouped by category with a category selector in front of the
// field. Matches read "Category: item".
class CategorizedSearchBox : public SearchBoxWithSuggestions {
public:
    static constexpr int kSelectorWidth = 140;

    explicit CategorizedSearchBox(const std::string& placeholder = "Search...");
    ~CategorizedSearchBox() override;

    void add_category(const std::string& name, const std::vector<std::string>& items);
    // Empty selects every category. Unknown names are ignored.
    void set_category(const std::string& name);
    const std::string& category() const { return category_; }
    std::vector<std::string> categories() const;
    Dropdown* selector() const { return selector_.get(); }

    void set_on_category_changed(std::function<void(const std::string&)> cb) { on_category_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    std::vector<std::string> compute_matches(const std::string& query) const override;

private:
    std::vector<std::pair<std::string, std::vector<std::string>>> categories_;
    std::string category_;
    std::unique_ptr<Dropdown> selector_;
    std::function<void(const std::string&)> on_category_changed_{};
};
