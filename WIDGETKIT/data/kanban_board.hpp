#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "base/base_card.hpp"

class BaseButton;
class Label;
class ScrollArea;

// Card that can be dragged between columns. A drag starts once the pointer
// has moved 10 px (Manhattan) from the press; from then on the board owns
// the gesture.
class KanbanCard : public BaseCard {
public:
    static constexpr int kDragDistance = 10;
    static constexpr const char* kPayloadPrefix = "kanban_card:";

    KanbanCard(const std::string& id, const std::string& title, const std::string& description = {});

    const std::string& id() const { return id_; }
    // Hides BaseCard::set_title: the card title sits in the body, bold.
    void set_title(const std::string& title);
    const std::string& title() const { return title_; }
    void set_description(const std::string& description);
    const std::string& description() const { return description_; }

    // {"id", "title", "description"}
    nlohmann::json data() const;
    std::string drag_payload() const { return kPayloadPrefix + id_; }

    // Dragged cards draw faded until the drag ends.
    bool is_dragging() const { return dragging_; }
    void end_drag();

    void set_on_double_clicked(std::function<void()> cb) { on_double_clicked_ = std::move(cb); }
    void set_on_drag_started(std::function<void(KanbanCard&)> cb) { on_drag_started_ = std::move(cb); }

    bool handle_event(const SDL_Event& e) override;

private:
    std::string id_;
    std::string title_;
    std::string description_;
    Label* heading_ = nullptr;
    Label* text_ = nullptr;
    bool armed_ = false;
    bool dragging_ = false;
    SDL_Point press_point_{0, 0};
    std::function<void()> on_double_clicked_{};
    std::function<void(KanbanCard&)> on_drag_started_{};
};

// Column of cards with a title, a card counter and a "+" button.
class KanbanColumn : public Widget {
public:
    static constexpr int kWidth = 260;

    KanbanColumn(const std::string& title, const std::string& id);
    ~KanbanColumn() override;

    const std::string& id() const { return id_; }
    void set_title(const std::string& title);
    const std::string& title() const { return title_; }

    KanbanCard* add_card(std::unique_ptr<KanbanCard> card);
    std::unique_ptr<KanbanCard> take_card(const std::string& card_id);
    bool remove_card(const std::string& card_id);
    KanbanCard* get_card(const std::string& card_id) const;
    const std::vector<KanbanCard*>& cards() const { return cards_; }
    int card_count() const { return static_cast<int>(cards_.size()); }

    void set_drop_highlight(bool on) { drop_highlight_ = on; }
    bool is_drop_highlighted() const { return drop_highlight_; }
    BaseButton* add_button() const { return add_button_; }

    // {"title": "New Card", "description": "Click to edit..."}
    void set_on_card_added(std::function<void(const nlohmann::json&)> cb) { on_card_added_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void refresh_count();

    std::string title_;
    std::string id_;
    std::unique_ptr<BoxLayout> layout_;
    Label* title_label_ = nullptr;
    Label* count_label_ = nullptr;
    BaseButton* add_button_ = nullptr;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* card_box_ = nullptr;
    std::vector<KanbanCard*> cards_;
    bool drop_highlight_ = false;
    std::function<void(const nlohmann::json&)> on_card_added_{};
};

// Board of columns. Cards dropped on another column move there; dropping on
// the column they came from does nothing.
//
// Board data:
//   {"columns": [{"id": "todo", "title": "To Do",
//                 "cards": [{"id": "c1", "title": "...", "description": "..."}]}]}
class KanbanBoard : public Widget {
public:
    KanbanBoard();
    ~KanbanBoard() override;

    // Returns nullptr when a column with the id already exists. An empty id
    // is generated.
    KanbanColumn* add_column(const std::string& title, const std::string& id = {});
    bool remove_column(const std::string& id);
    KanbanColumn* find_column(const std::string& id) const;
    const std::vector<KanbanColumn*>& columns() const { return columns_; }
    int column_count() const { return static_cast<int>(columns_.size()); }

    // nullptr for an unknown column or an id that is already on the board.
    KanbanCard* add_card(const std::string& column_id, const std::string& title,
                         const std::string& description = {}, const std::string& id = {});
    bool remove_card(const std::string& card_id);
    KanbanCard* find_card(const std::string& card_id) const;
    // Column holding the card, or "" when it is not on the board.
    std::string card_column(const std::string& card_id) const;
    int card_count() const { return static_cast<int>(card_columns_.size()); }

    bool move_card(const std::string& card_id, const std::string& to_column);
    // Handles a "kanban_card:<id>" payload dropped on a column.
    bool drop_payload(const std::string& payload, const std::string& column_id);

    nlohmann::json get_board_data() const;
    // Replaces the board. Returns false when the data is malformed.
    bool load_board_data(const nlohmann::json& data);
    bool save_to_file(const std::string& path) const;
    bool load_from_file(const std::string& path);

    // "Add Column" button: appends "Column N".
    void add_new_column();
    BaseButton* add_column_button() const { return add_column_button_; }

    KanbanCard* dragged_card() const { return drag_card_; }
    SDL_Point drag_point() const { return drag_point_; }
    KanbanColumn* column_at(SDL_Point p) const;

    void set_on_card_moved(std::function<void(const std::string&, const std::string&, const std::string&)> cb) {
        on_card_moved_ = std::move(cb);
    }
    // Fired by a column's "+" button. Without a handler the board adds the
    // card itself.
    void set_on_card_created(std::function<void(const std::string&, const nlohmann::json&)> cb) {
        on_card_created_ = std::move(cb);
    }
    void set_on_column_added(std::function<void(const std::string&)> cb) { on_column_added_ = std::move(cb); }
    void set_on_card_clicked(std::function<void(const std::string&)> cb) { on_card_clicked_ = std::move(cb); }
    void set_on_card_double_clicked(std::function<void(const std::string&)> cb) {
        on_card_double_clicked_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    KanbanCard* attach_card(KanbanColumn* column, std::unique_ptr<KanbanCard> card);
    void begin_drag(KanbanCard& card);
    void finish_drag(SDL_Point p);
    void set_drop_target(KanbanColumn* column);
    void clear_board();

    std::unique_ptr<BoxLayout> layout_;
    BoxLayout* header_ = nullptr;
    BoxLayout* column_box_ = nullptr;
    BaseButton* add_column_button_ = nullptr;
    std::vector<KanbanColumn*> columns_;
    // card id -> column id
    std::vector<std::pair<std::string, std::string>> card_columns_;
    int next_column_ = 1;
    int next_card_ = 1;
    KanbanCard* drag_card_ = nullptr;
    KanbanColumn* drop_target_ = nullptr;
    SDL_Point drag_point_{0, 0};
    std::function<void(const std::string&, const std::string&, const std::string&)> on_card_moved_{};
    std::function<void(const std::string&, const nlohmann::json&)> on_card_created_{};
    std::function<void(const std::string&)> on_column_added_{};
    std::function<void(const std::string&)> on_card_clicked_{};
    std::function<void(const std::string&)> on_card_double_clicked_{};
};
