#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/widget.hpp"

class BoxLayout;
class IconButton;
class Label;
class ScrollArea;
class TextBox;

struct SearchResult {
    std::string title;
    std::string description;
    // Filled in with the provider name when the result is collected.
    std::string provider;
    // Relevance in percent; 0 hides it.
    double score = 0.0;
    nlohmann::json data = nlohmann::json::object();
};

using SearchProvider = std::function<std::vector<SearchResult>(const std::string& query)>;

class SearchResultRow : public Widget {
public:
    explicit SearchResultRow(const SearchResult& result);

    void set_selected(bool s) { selected_ = s; }
    bool is_selected() const { return selected_; }
    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    SearchResult result_;
    bool selected_ = false;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
};

// Search box that asks every registered provider for results and lists
// them grouped by provider. Typing searches after a 300 ms pause once the
// query has two characters; Enter searches at once or, when the list is
// current, picks the selected result. Up and Down move the selection.
class GlobalSearch : public Widget {
public:
    static constexpr Uint32 kDebounceMs = 300;
    static constexpr size_t kMinQueryLength = 2;

    explicit GlobalSearch(const std::string& placeholder = "Search everything...");
    ~GlobalSearch() override;

    // Re-adding a name replaces the function and keeps its position.
    void add_provider(const std::string& name, SearchProvider provider);
    bool remove_provider(const std::string& name);
    std::vector<std::string> providers() const;
    // Restricts searches to one provider; empty searches all of them.
    void set_provider_filter(const std::string& name);
    const std::string& provider_filter() const { return provider_filter_; }

    // Same as typing: the search runs after the debounce.
    void set_query(const std::string& text);
    std::string query() const;
    void search_now();
    void clear_search();

    const std::vector<SearchResult>& results() const { return results_; }
    int result_count() const { return static_cast<int>(results_.size()); }
    int selected_index() const { return selected_; }
    void set_selected_index(int index);
    void select_next();
    void select_previous();
    // Emits result_selected for the selection.
    bool activate_selected();
    SearchResultRow* row(int index) const;

    const std::string& status_text() const;
    void set_placeholder(const std::string& placeholder);
    void focus_search();

    TextBox* search_box() const { return search_; }
    IconButton* clear_button() const { return clear_button_; }

    void set_on_search_performed(std::function<void(const std::string&)> cb) { on_search_performed_ = std::move(cb); }
    void set_on_result_selected(std::function<void(const std::string&, const SearchResult&)> cb) {
        on_result_selected_ = std::move(cb);
    }
    void set_on_search_cleared(std::function<void()> cb) { on_search_cleared_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Provider {
        std::string name;
        SearchProvider fn;
    };

    void on_text_changed(const std::string& text);
    void rebuild();
    void clear_results();

    std::vector<Provider> providers_;
    std::string provider_filter_;
    std::vector<SearchResult> results_;
    std::vector<SearchResultRow*> rows_;
    std::string searched_query_;
    int selected_ = -1;
    bool clearing_ = false;
    Timer search_timer_;
    std::unique_ptr<BoxLayout> layout_;
    TextBox* search_ = nullptr;
    IconButton* clear_button_ = nullptr;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* list_ = nullptr;
    Label* status_label_ = nullptr;
    std::function<void(const std::string&)> on_search_performed_{};
    std::function<void(const std::string&, const SearchResult&)> on_result_selected_{};
    std::function<void()> on_search_cleared_{};
};
