#include "pinned_note.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRadius = 6;
constexpr int kHeaderButton = 24;
constexpr int kCascadeOrigin = 16;
constexpr int kDuplicateOffset = 20;
const char* const kSwatchGlyph = "\xE2\x97\x8F";

struct NoteColor {
    const char* name;
    const char* hex;
};

const NoteColor kNoteColors[] = {
    { "yellow", "#FFE066" },
    { "blue", "#A5D8FF" },
    { "green", "#B2F2BB" },
    { "pink", "#FFC9DE" },
    { "purple", "#D0BFFF" },
};

SDL_Color ink() { return wk::rgba(33, 37, 41); }

std::string created_text(std::time_t t) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%b %d, %H:%M", &local);
    return std::string(buf, n);
}
}

PinnedNote::PinnedNote(const std::string& title, const std::string& content, const std::string& color)
    : created_(std::time(nullptr)),
      header_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 2)),
      body_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 4)) {
    header_->set_parent(this);
    header_->set_margins(10, 4, 4, 4);
    header_->set_alignment(BoxLayout::Align::Center);
    title_label_ = header_->add_widget(std::make_unique<Label>("", "default", "text"), 1);
    title_label_->set_bold(true);
    title_label_->set_color(ink());
    title_label_->set_elide(true);
    title_editor_ = header_->add_widget(std::make_unique<TextBox>(), 1);
    title_editor_->hide();
    title_editor_->set_on_submitted([this](const std::string&) { commit_edit(); });
    title_editor_->set_on_escape([this]() { cancel_edit(); });
    title_editor_->set_on_focus_changed([this](bool focused) {
        if (!focused && editing_ == EditField::Title) commit_edit();
    });

    pin_button_ = header_->add_widget(std::make_unique<IconButton>("pin", kHeaderButton));
    pin_button_->set_on_clicked([this]() {
        toggle_pin();
        notify_changed();
    });
    color_button_ = header_->add_widget(std::make_unique<IconButton>(kSwatchGlyph, kHeaderButton));
    color_button_->set_tooltip("Change color");
    color_button_->set_on_clicked([this]() {
        cycle_color();
        notify_changed();
    });
    close_button_ = header_->add_widget(std::make_unique<IconButton>("close", kHeaderButton));
    close_button_->set_tooltip("Close");
    close_button_->set_on_clicked([this]() {
        if (on_close_requested_) on_close_requested_();
    });

    body_->set_parent(this);
    body_->set_margins(10, 6, 10, 8);
    content_label_ = body_->add_widget(std::make_unique<Label>("", "default", "text"), 1);
    content_label_->set_word_wrap(true);
    content_label_->set_color(ink());
    content_editor_ = body_->add_widget(std::make_unique<TextBox>("", "", true), 1);
    content_editor_->hide();
    content_editor_->set_on_submitted([this](const std::string&) { commit_edit(); });
    content_editor_->set_on_escape([this]() { cancel_edit(); });
    content_editor_->set_on_focus_changed([this](bool focused) {
        if (!focused && editing_ == EditField::Content) commit_edit();
    });
    time_label_ = body_->add_widget(std::make_unique<Label>("", "caption", "text"));
    time_label_->set_color(wk::with_alpha(ink(), 150));

    set_title(title);
    set_content(content);
    set_color(color);
    set_created(created_);
    refresh_pin();
    rect_ = SDL_Rect{ 0, 0, kWidth, kHeight };
    layout();
}

PinnedNote::~PinnedNote() = default;

const std::vector<std::string>& PinnedNote::color_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& c : kNoteColors) out.emplace_back(c.name);
        return out;
    }();
    return names;
}

SDL_Color PinnedNote::note_color(const std::string& name) {
    for (const auto& c : kNoteColors) {
        if (name == c.name) return wk::parse_hex(c.hex);
    }
    return wk::parse_hex(kNoteColors[0].hex);
}

void PinnedNote::set_title(const std::string& title) {
    title_ = title;
    title_label_->set_text(title);
}

void PinnedNote::set_content(const std::string& content) {
    content_ = content;
    content_label_->set_text(content);
}

void PinnedNote::set_color(const std::string& name) {
    const auto& names = color_names();
    color_ = std::find(names.begin(), names.end(), name) != names.end() ? name : names.front();
    color_button_->set_tooltip("Color: " + color_);
}

void PinnedNote::cycle_color() {
    const auto& names = color_names();
    auto it = std::find(names.begin(), names.end(), color_);
    const size_t next = it == names.end() ? 0 : static_cast<size_t>(it - names.begin() + 1) % names.size();
    set_color(names[next]);
}

void PinnedNote::set_pinned(bool pinned) {
    pinned_ = pinned;
    if (pinned_) {
        header_pressed_ = false;
        dragging_ = false;
    }
    refresh_pin();
}

void PinnedNote::refresh_pin() {
    pin_button_->set_variant(pinned_ ? ButtonVariant::Primary : ButtonVariant::Ghost);
    pin_button_->set_tooltip(pinned_ ? "Unpin" : "Pin");
}

void PinnedNote::set_created(std::time_t t) {
    created_ = t;
    time_label_->set_text(created_text(t));
}

void PinnedNote::move_to(int x, int y) { set_rect(SDL_Rect{ x, y, rect_.w, rect_.h }); }

void PinnedNote::start_edit(EditField field) {
    if (field == EditField::None || editing_ == field) return;
    if (editing_ != EditField::None) commit_edit();
    editing_ = field;
    if (field == EditField::Title) {
        title_editor_->set_text(title_);
        title_label_->hide();
        title_editor_->show();
        layout();
        title_editor_->set_caret(title_.size());
        title_editor_->set_focus(true);
    } else {
        content_editor_->set_text(content_);
        content_label_->hide();
        content_editor_->show();
        layout();
        content_editor_->set_caret(content_.size());
        content_editor_->set_focus(true);
    }
}

bool PinnedNote::commit_edit() {
    const EditField field = editing_;
    if (field == EditField::None) return false;
    editing_ = EditField::None;
    bool changed = false;
    if (field == EditField::Title) {
        const std::string text = wk_text::trim(title_editor_->text());
        title_editor_->set_focus(false);
        title_editor_->hide();
        title_label_->show();
        // An empty title keeps the old one.
        if (!text.empty() && text != title_) {
            set_title(text);
            changed = true;
        }
    } else {
        const std::string text = content_editor_->text();
        content_editor_->set_focus(false);
        content_editor_->hide();
        content_label_->show();
        if (text != content_) {
            set_content(text);
            changed = true;
        }
    }
    layout();
    if (changed) notify_changed();
    return true;
}

void PinnedNote::cancel_edit() {
    const EditField field = editing_;
    if (field == EditField::None) return;
    editing_ = EditField::None;
    TextBox* editor = field == EditField::Title ? title_editor_ : content_editor_;
    editor->set_focus(false);
    editor->hide();
    if (field == EditField::Title) title_label_->show();
    else content_label_->show();
    layout();
}

void PinnedNote::notify_changed() {
    if (on_changed_) on_changed_();
}

SDL_Rect PinnedNote::header_rect() const { return SDL_Rect{ rect_.x, rect_.y, rect_.w, kHeaderHeight }; }

SDL_Rect PinnedNote::body_rect() const {
    return SDL_Rect{ rect_.x, rect_.y + kHeaderHeight, rect_.w, std::max(0, rect_.h - kHeaderHeight) };
}

nlohmann::json PinnedNote::to_json() const {
    return nlohmann::json{ { "id", id_ },
                           { "title", title_ },
                           { "content", content_ },
                           { "color", color_ },
                           { "pinned", pinned_ },
                           { "x", rect_.x },
                           { "y", rect_.y },
                           { "w", rect_.w },
                           { "h", rect_.h },
                           { "created", static_cast<long long>(created_) } };
}

void PinnedNote::apply_json(const nlohmann::json& data) {
    if (!data.is_object()) throw std::invalid_argument("note entry must be an object");
    id_ = data.value("id", id_);
    set_title(data.value("title", title_));
    set_content(data.value("content", content_));
    set_color(data.value("color", color_));
    set_pinned(data.value("pinned", pinned_));
    set_created(static_cast<std::time_t>(data.value("created", static_cast<long long>(created_))));
    const int w = data.value("w", rect_.w);
    const int h = data.value("h", rect_.h);
    set_rect(SDL_Rect{ data.value("x", rect_.x), data.value("y", rect_.y), w > 0 ? w : kWidth, h > 0 ? h : kHeight });
}

int PinnedNote::preferred_width() const { return fixed_w_ >= 0 ? fixed_w_ : kWidth; }

int PinnedNote::height_for_width(int) const { return fixed_h_ >= 0 ? fixed_h_ : kHeight; }

void PinnedNote::layout() {
    header_->set_rect(header_rect());
    body_->set_rect(body_rect());
}

bool PinnedNote::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);

    if ((wk::is_left_press(e) || wk::is_right_press(e)) && contains(e.button.x, e.button.y) && on_pressed_) {
        on_pressed_();
    }

    if (header_pressed_) {
        if (e.type == SDL_MOUSEMOTION) {
            const SDL_Point p = wk::event_point(e);
            if (!dragging_ && (std::abs(p.x - press_point_.x) > kDragThreshold ||
                               std::abs(p.y - press_point_.y) > kDragThreshold)) {
                dragging_ = true;
            }
            if (dragging_) move_to(p.x - drag_offset_.x, p.y - drag_offset_.y);
            return true;
        }
        if (wk::is_left_release(e)) {
            header_pressed_ = false;
            if (dragging_) {
                dragging_ = false;
                if (on_moved_) on_moved_(rect_.x, rect_.y);
            }
            return true;
        }
    }

    if (header_->handle_event(e)) return true;
    if (body_->handle_event(e)) return true;

    if (wk::is_left_press(e)) {
        const SDL_Point p{ e.button.x, e.button.y };
        if (wk::point_in(header_rect(), p)) {
            if (e.button.clicks >= 2) {
                start_edit(EditField::Title);
            } else if (!pinned_) {
                header_pressed_ = true;
                press_point_ = p;
                drag_offset_ = SDL_Point{ p.x - rect_.x, p.y - rect_.y };
            }
            return true;
        }
        if (wk::point_in(body_rect(), p)) {
            if (e.button.clicks >= 2) start_edit(EditField::Content);
            return true;
        }
    }
    if (wk::is_pointer_event(e) && e.type != SDL_MOUSEMOTION && contains(e.button.x, e.button.y)) return true;
    return false;
}

void PinnedNote::update() {
    header_->update();
    body_->update();
}

void PinnedNote::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const float alpha = effective_opacity();
    const SDL_Color fill = note_color(color_);
    wk_draw::draw_shadow(r, rect_, kRadius, dragging_ ? 8 : 4, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, kRadius, fill, alpha);

    const SDL_Rect head = header_rect();
    const SDL_Color head_fill = wk::darken(fill, 0.08f);
    wk_draw::fill_rounded_rect(r, head, kRadius, head_fill, alpha);
    wk_draw::fill_rect(r, SDL_Rect{ head.x, head.y + head.h / 2, head.w, head.h - head.h / 2 }, head_fill, alpha);
    wk_draw::draw_rounded_rect(r, rect_, kRadius, wk::darken(fill, 0.2f), alpha);

    header_->render(r);
    wk_draw::ClipScope clip(r, body_rect());
    body_->render(r);
}

NoteManager::NoteManager() : toolbar_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8)) {
    toolbar_->set_parent(this);
    toolbar_->set_margins(8);
    add_button_ = toolbar_->add_widget(std::make_unique<BaseButton>("Add Note", ButtonVariant::Primary, ButtonSize::Small));
    add_button_->set_icon("plus");
    add_button_->set_on_clicked([this]() { create_note(); });
    clear_button_ = toolbar_->add_widget(
        std::make_unique<BaseButton>("Clear All", ButtonVariant::Secondary, ButtonSize::Small));
    clear_button_->set_on_clicked([this]() { clear_notes(); });
    toolbar_->add_stretch();
    const SDL_Rect area = notes_area();
    origin_ = SDL_Point{ area.x, area.y };
}

NoteManager::~NoteManager() = default;

SDL_Rect NoteManager::notes_area() const {
    const int bar = toolbar_->height_for_width(toolbar_->preferred_width());
    return SDL_Rect{ rect_.x, rect_.y + bar, rect_.w, std::max(0, rect_.h - bar) };
}

PinnedNote* NoteManager::create_note(const std::string& title, const std::string& content, const std::string& color) {
    auto note = std::make_unique<PinnedNote>(title, content, color);
    const int step = (created_count_++ % kCascadeCount) * kCascadeStep;
    note->move_to(origin_.x + kCascadeOrigin + step, origin_.y + kCascadeOrigin + step);
    return add_note(std::move(note));
}

PinnedNote* NoteManager::add_note(std::unique_ptr<PinnedNote> note) {
    if (!note) return nullptr;
    if (note->id().empty() || find_note(note->id())) {
        std::string id;
        do {
            id = "note-" + std::to_string(next_id_++);
        } while (find_note(id));
        note->set_id(id);
    }
    PinnedNote* raw = note.get();
    raw->set_parent(this);
    wire(raw);
    notes_.push_back(std::move(note));
    notify_changed();
    return raw;
}

void NoteManager::wire(PinnedNote* note) {
    note->set_on_pressed([this, note]() { bring_to_front(note->id()); });
    note->set_on_close_requested([this, note]() { pending_close_.push_back(note->id()); });
    note->set_on_changed([this]() { notify_changed(); });
    note->set_on_moved([this](int, int) { notify_changed(); });
}

PinnedNote* NoteManager::duplicate_note(const std::string& id) {
    const PinnedNote* src = find_note(id);
    if (!src) return nullptr;
    auto copy = std::make_unique<PinnedNote>(src->title(), src->content(), src->color());
    const SDL_Rect r = src->rect();
    copy->set_rect(SDL_Rect{ r.x + kDuplicateOffset, r.y + kDuplicateOffset, r.w, r.h });
    return add_note(std::move(copy));
}

bool NoteManager::remove_note(const std::string& id) {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [&id](const std::unique_ptr<PinnedNote>& n) { return n->id() == id; });
    if (it == notes_.end()) return false;
    notes_.erase(it);
    notify_changed();
    return true;
}

void NoteManager::clear_notes() {
    notes_.clear();
    pending_close_.clear();
    created_count_ = 0;
    notify_changed();
}

PinnedNote* NoteManager::find_note(const std::string& id) const {
    for (const auto& n : notes_) {
        if (n->id() == id) return n.get();
    }
    return nullptr;
}

std::vector<PinnedNote*> NoteManager::notes() const {
    std::vector<PinnedNote*> out;
    for (const auto& n : notes_) out.push_back(n.get());
    return out;
}

bool NoteManager::bring_to_front(const std::string& id) {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [&id](const std::unique_ptr<PinnedNote>& n) { return n->id() == id; });
    if (it == notes_.end()) return false;
    std::rotate(it, it + 1, notes_.end());
    return true;
}

void NoteManager::notify_changed() {
    if (on_notes_changed_) on_notes_changed_();
}

nlohmann::json NoteManager::to_json() const {
    nlohmann::json notes = nlohmann::json::array();
    for (const auto& n : notes_) {
        nlohmann::json j = n->to_json();
        j["x"] = n->rect().x - origin_.x;
        j["y"] = n->rect().y - origin_.y;
        notes.push_back(j);
    }
    return nlohmann::json{ { "notes", notes } };
}

bool NoteManager::load_json(const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("notes") || !data["notes"].is_array()) {
        std::cerr << "[NoteManager] Notes data must be an object with a notes array\n";
        return false;
    }
    std::vector<std::unique_ptr<PinnedNote>> loaded;
    try {
        for (const auto& entry : data["notes"]) {
            auto note = std::make_unique<PinnedNote>();
            note->apply_json(entry);
            note->move_to(note->rect().x + origin_.x, note->rect().y + origin_.y);
            loaded.push_back(std::move(note));
        }
    } catch (const std::exception& e) {
        std::cerr << "[NoteManager] Invalid notes data: " << e.what() << "\n";
        return false;
    }
    notes_.clear();
    pending_close_.clear();
    for (auto& note : loaded) {
        if (note->id().empty() || find_note(note->id())) {
            std::string id;
            do {
                id = "note-" + std::to_string(next_id_++);
            } while (find_note(id));
            note->set_id(id);
        }
        note->set_parent(this);
        wire(note.get());
        notes_.push_back(std::move(note));
    }
    notify_changed();
    return true;
}

bool NoteManager::save_notes(const std::string& path) const {
    try {
        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + path + " for writing.");
        }
        out << to_json().dump(2);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[NoteManager] Failed to save notes: " << e.what() << "\n";
        return false;
    }
}

bool NoteManager::load_notes(const std::string& path) {
    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "[NoteManager] Unable to open notes file " << path << "\n";
            return false;
        }
        nlohmann::json j;
        in >> j;
        if (!load_json(j)) return false;
        std::cout << "[NoteManager] Loaded " << notes_.size() << " notes from " << path << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[NoteManager] Failed to load " << path << ": " << e.what() << "\n";
        return false;
    }
}

int NoteManager::preferred_width() const { return fixed_w_ >= 0 ? fixed_w_ : 800; }

int NoteManager::height_for_width(int) const { return fixed_h_ >= 0 ? fixed_h_ : 600; }

void NoteManager::layout() {
    const SDL_Rect area = notes_area();
    toolbar_->set_rect(SDL_Rect{ rect_.x, rect_.y, rect_.w, area.y - rect_.y });
    const int dx = area.x - origin_.x;
    const int dy = area.y - origin_.y;
    origin_ = SDL_Point{ area.x, area.y };
    if (dx == 0 && dy == 0) return;
    for (auto& n : notes_) n->move_to(n->rect().x + dx, n->rect().y + dy);
}

bool NoteManager::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (toolbar_->handle_event(e)) return true;
    // Pressing a note reorders notes_.
    const std::vector<PinnedNote*> snapshot = notes();
    for (auto it = snapshot.rbegin(); it != snapshot.rend(); ++it) {
        if ((*it)->handle_event(e)) return true;
    }
    return false;
}

void NoteManager::update() {
    if (!pending_close_.empty()) {
        std::vector<std::string> ids;
        ids.swap(pending_close_);
        for (const auto& id : ids) remove_note(id);
    }
    toolbar_->update();
    for (const auto& n : notes_) n->update();
}

void NoteManager::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Rect area = notes_area();
    wk_draw::fill_rect(r, rect_, tm.color("background"), alpha);
    toolbar_->render(r);
    wk_draw::fill_rect(r, SDL_Rect{ rect_.x, area.y - 1, rect_.w, 1 }, tm.color("border"), alpha);
    wk_draw::ClipScope clip(r, area);
    if (notes_.empty()) {
        wk_text::draw_in_rect(r, Styles::Label("caption", "text_secondary"), "No notes yet", area,
                              wk_text::Align::Center, alpha);
    }
    for (const auto& n : notes_) n->render(r);
}
