#pragma once

#include <SDL.h>
#include <ctime>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class IconButton;
class Label;
class TextBox;

// Sticky note: a coloured card with a title bar that drags it around, pin,
// colour and close buttons, and a text body. Double-clicking the title or
// the body edits it in place; Enter (Ctrl+Enter in the body) or leaving the
// editor saves, Escape cancels.
class PinnedNote : public Widget {
public:
    static constexpr int kWidth = 220;
    static constexpr int kHeight = 200;
    static constexpr int kHeaderHeight = 32;
    static constexpr int kDragThreshold = 4;

    enum class EditField { None, Title, Content };

    explicit PinnedNote(const std::string& title = "New Note", const std::string& content = {},
                        const std::string& color = "yellow");
    ~PinnedNote() override;

    // yellow, blue, green, pink, purple.
    static const std::vector<std::string>& color_names();
    // Unknown names give the yellow fill.
    static SDL_Color note_color(const std::string& name);

    void set_id(const std::string& id) { id_ = id; }
    const std::string& id() const { return id_; }
    void set_title(const std::string& title);
    const std::string& title() const { return title_; }
    void set_content(const std::string& content);
    const std::string& content() const { return content_; }
    // Unknown names fall back to yellow.
    void set_color(const std::string& name);
    const std::string& color() const { return color_; }
    void cycle_color();
    // Pinned notes cannot be dragged.
    void set_pinned(bool pinned);
    bool is_pinned() const { return pinned_; }
    void toggle_pin() { set_pinned(!pinned_); }
    std::time_t created() const { return created_; }
    void set_created(std::time_t t);

    void move_to(int x, int y);
    bool is_dragging() const { return dragging_; }

    void start_edit(EditField field);
    bool commit_edit();
    void cancel_edit();
    EditField editing() const { return editing_; }
    TextBox* title_editor() const { return title_editor_; }
    TextBox* content_editor() const { return content_editor_; }

    SDL_Rect header_rect() const;
    SDL_Rect body_rect() const;
    IconButton* pin_button() const { return pin_button_; }
    IconButton* color_button() const { return color_button_; }
    IconButton* close_button() const { return close_button_; }

    // {id, title, content, color, pinned, x, y, w, h, created}
    nlohmann::json to_json() const;
    // Missing keys keep their current values; throws nlohmann::json errors on
    // mistyped values.
    void apply_json(const nlohmann::json& data);

    void set_on_changed(std::function<void()> cb) { on_changed_ = std::move(cb); }
    void set_on_moved(std::function<void(int, int)> cb) { on_moved_ = std::move(cb); }
    void set_on_close_requested(std::function<void()> cb) { on_close_requested_ = std::move(cb); }
    // Any press on the note; the manager raises it.
    void set_on_pressed(std::function<void()> cb) { on_pressed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void refresh_pin();
    void notify_changed();

    std::string id_;
    std::string title_;
    std::string content_;
    std::string color_;
    bool pinned_ = false;
    std::time_t created_;
    EditField editing_ = EditField::None;
    std::unique_ptr<BoxLayout> header_;
    Label* title_label_ = nullptr;
    TextBox* title_editor_ = nullptr;
    IconButton* pin_button_ = nullptr;
    IconButton* color_button_ = nullptr;
    IconButton* close_button_ = nullptr;
    std::unique_ptr<BoxLayout> body_;
    Label* content_label_ = nullptr;
    TextBox* content_editor_ = nullptr;
    Label* time_label_ = nullptr;
    bool header_pressed_ = false;
    bool dragging_ = false;
    SDL_Point press_point_{ 0, 0 };
    SDL_Point drag_offset_{ 0, 0 };
    std::function<void()> on_changed_{};
    std::function<void(int, int)> on_moved_{};
    std::function<void()> on_close_requested_{};
    std::function<void()> on_pressed_{};
};

// Board of sticky notes. The last note is drawn on top and sees events
// first; pressing a note raises it. Note positions in JSON are relative to
// the board's note area.
class NoteManager : public Widget {
public:
    static constexpr int kCascadeStep = 24;
    static constexpr int kCascadeCount = 8;

    NoteManager();
    ~NoteManager() override;

    PinnedNote* create_note(const std::string& title = "New Note", const std::string& content = {},
                            const std::string& color = "yellow");
    // Takes ownership; assigns an id when the note has none.
    PinnedNote* add_note(std::unique_ptr<PinnedNote> note);
    // Copy offset by 20 px.
    PinnedNote* duplicate_note(const std::string& id);
    bool remove_note(const std::string& id);
    void clear_notes();
    PinnedNote* find_note(const std::string& id) const;
    // Bottom to top.
    std::vector<PinnedNote*> notes() const;
    int note_count() const { return static_cast<int>(notes_.size()); }
    bool bring_to_front(const std::string& id);

    // Area below the toolbar where notes live.
    SDL_Rect notes_area() const;

    nlohmann::json to_json() const;
    // Replaces the board. Returns false (board unchanged) on malformed data.
    bool load_json(const nlohmann::json& data);
    bool save_notes(const std::string& path) const;
    bool load_notes(const std::string& path);

    BaseButton* add_button() const { return add_button_; }
    BaseButton* clear_button() const { return clear_button_; }

    void set_on_notes_changed(std::function<void()> cb) { on_notes_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    void wire(PinnedNote* note);
    void notify_changed();

    std::unique_ptr<BoxLayout> toolbar_;
    BaseButton* add_button_ = nullptr;
    BaseButton* clear_button_ = nullptr;
    std::vector<std::unique_ptr<PinnedNote>> notes_;
    std::vector<std::string> pending_close_;
    SDL_Point origin_{ 0, 0 };
    int next_id_ = 1;
    int created_count_ = 0;
    std::function<void()> on_notes_changed_{};
};
