#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "base/base_popup.hpp"
#include "core/clock.hpp"

class Label;
class TextBox;
class CommandListView;

// Modal 600x400 popup with a search box over a filtered command list.
// Commands are keyed by name; adding a name again replaces the command.
//
// A command matches when the lowercased "name description category" text
// contains the query. Matches whose name starts with the query sort first,
// then everything sorts by name. Up and Down wrap around, Enter runs the
// selected command and Escape closes.
class CommandPalette : public BasePopup {
public:
    static constexpr int kWidth = 600;
    static constexpr int kHeight = 400;
    static constexpr int kRowHeight = 36;
    static constexpr int kRowHeightWithDescription = 52;
    static constexpr int kCategoryHeight = 28;

    struct Command {
        std::string name;
        std::string description;
        std::string shortcut;
        nlohmann::json data;
        std::string category;
        std::string icon;
        std::string search_text;
    };

    CommandPalette();
    ~CommandPalette() override;

    void add_command(const std::string& name, const std::string& description = {}, const std::string& shortcut = {},
                     const nlohmann::json& data = nlohmann::json::object(), const std::string& category = {},
                     const std::string& icon = {});
    bool remove_command(const std::string& name);
    void clear_commands();
    size_t command_count() const { return commands_.size(); }
    bool has_command(const std::string& name) const;
    const Command* find_command(const std::string& name) const;

    // Clears the query, selects the first command, shows the popup centred
    // and focuses the search box.
    void show_palette();

    void set_query(const std::string& text);
    std::string query() const;
    // Names of the matching commands in display order.
    std::vector<std::string> filtered_commands() const;
    int selected_index() const { return selected_; }
    void set_selected_index(int index);
    std::string selected_command() const;
    void select_next();
    void select_previous();
    // Emits command_executed for the selection and closes.
    bool execute_selected();

    // Screen rect of the n-th filtered command; empty when scrolled away.
    SDL_Rect command_rect(int index) const;
    TextBox* search_box() const { return search_; }

    void set_on_command_executed(std::function<void(const std::string&, const nlohmann::json&)> cb) {
        on_command_executed_ = std::move(cb);
    }

    bool handle_event(const SDL_Event& e) override;

protected:
    // Matching commands for a lowercased, trimmed query, in display order.
    virtual std::vector<const Command*> match_commands(const std::string& query) const;
    // Called on every edit of the search box.
    virtual void query_edited() { refilter(); }
    void refilter();
    const std::vector<Command>& commands() const { return commands_; }

private:
    friend class CommandListView;

    struct Row {
        bool category = false;
        std::string text;
        int command = -1;
        int y = 0;
        int h = 0;
    };

    void ensure_selected_visible();
    void execute(int index);
    int list_height() const;

    std::vector<Command> commands_;
    std::vector<const Command*> filtered_;
    std::vector<Row> rows_;
    int selected_ = -1;
    int scroll_ = 0;
    TextBox* search_ = nullptr;
    CommandListView* list_ = nullptr;
    Label* footer_ = nullptr;
    std::function<void(const std::string&, const nlohmann::json&)> on_command_executed_{};
};

// Palette preloaded with the common file and edit commands.
class QuickCommandPalette : public CommandPalette {
public:
    QuickCommandPalette();
};

// Palette that ranks matches by relevance. Typing is debounced by 150 ms;
// an empty query lists every command in insertion order.
//
// Scores against the lowercased query q:
//   name == q 100, name starts with q 80, name contains q 60
//   description contains q +30, category contains q +20
//   each whitespace-separated word of q: +10 in name, +5 in description
// Commands scoring 0 are dropped; equal scores keep insertion order.
class SearchableCommandPalette : public CommandPalette {
public:
    static constexpr Uint32 kSearchDelay = 150;

    SearchableCommandPalette();

    static int search_score(const Command& command, const std::string& query);
    bool search_pending() const { return search_timer_.is_active(); }
    // Runs a pending search right away.
    void flush_search();

    void update() override;

protected:
    std::vector<const Command*> match_commands(const std::string& query) const override;
    void query_edited() override;

private:
    Timer search_timer_{ true };
};
