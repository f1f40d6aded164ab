#include "kanban_board.hpp"

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
constexpr int kCardSpacing = 8;
constexpr int kColumnSpacing = 16;
constexpr int kAddButtonSize = 24;
constexpr int kGhostWidth = 220;
constexpr int kGhostHeight = 40;
constexpr float kDraggedOpacity = 0.4f;

// Ids in saved boards may be numbers.
std::string id_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return {};
    return v.dump();
}
}

KanbanCard::KanbanCard(const std::string& id, const std::string& title, const std::string& description)
    : id_(id), title_(title), description_(description) {
    auto box = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, kCardSpacing);
    heading_ = box->add_widget(std::make_unique<Label>(title, "default", "text"));
    heading_->set_bold(true);
    heading_->set_elide(true);
    text_ = box->add_widget(std::make_unique<Label>(description, "default", "text_secondary"));
    text_->set_word_wrap(true);
    heading_->set_visible(!title.empty());
    text_->set_visible(!description.empty());
    set_body(std::move(box));
}

void KanbanCard::set_title(const std::string& title) {
    title_ = title;
    heading_->set_text(title);
    heading_->set_visible(!title.empty());
    layout();
}

void KanbanCard::set_description(const std::string& description) {
    description_ = description;
    text_->set_text(description);
    text_->set_visible(!description.empty());
    layout();
}

nlohmann::json KanbanCard::data() const {
    return nlohmann::json{ { "id", id_ }, { "title", title_ }, { "description", description_ } };
}

void KanbanCard::end_drag() {
    dragging_ = false;
    armed_ = false;
    set_opacity(1.0f);
}

bool KanbanCard::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        if (wk::point_in(rect_, p)) {
            armed_ = true;
            press_point_ = p;
            if (e.button.clicks >= 2 && on_double_clicked_) on_double_clicked_();
        }
    } else if (e.type == SDL_MOUSEMOTION && armed_ && !dragging_) {
        const SDL_Point p = wk::event_point(e);
        if (std::abs(p.x - press_point_.x) + std::abs(p.y - press_point_.y) >= kDragDistance) {
            armed_ = false;
            dragging_ = true;
            click_.reset();
            set_opacity(kDraggedOpacity);
            if (on_drag_started_) on_drag_started_(*this);
            return true;
        }
    } else if (wk::is_left_release(e)) {
        armed_ = false;
    }
    return BaseCard::handle_event(e);
}

KanbanColumn::KanbanColumn(const std::string& title, const std::string& id)
    : title_(title), id_(id), layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, kCardSpacing)) {
    layout_->set_parent(this);
    layout_->set_margins(8);

    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_margins(12, 8, 12, 8);
    header->set_alignment(BoxLayout::Align::Center);
    title_label_ = header->add_widget(std::make_unique<Label>(title, "heading", "text"), 1);
    title_label_->set_elide(true);
    count_label_ = header->add_widget(std::make_unique<Label>("0", "caption", "text_secondary"));
    add_button_ = header->add_widget(std::make_unique<BaseButton>("+", ButtonVariant::Ghost, ButtonSize::Small));
    add_button_->set_fixed_size(kAddButtonSize, kAddButtonSize);
    add_button_->set_on_clicked([this]() {
        const nlohmann::json card{ { "title", "New Card" }, { "description", "Click to edit..." } };
        if (on_card_added_) on_card_added_(card);
    });
    layout_->add_widget(std::move(header));

    auto box = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, kCardSpacing);
    card_box_ = box.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(box)), 1);
}

KanbanColumn::~KanbanColumn() = default;

void KanbanColumn::set_title(const std::string& title) {
    title_ = title;
    title_label_->set_text(title);
}

KanbanCard* KanbanColumn::add_card(std::unique_ptr<KanbanCard> card) {
    if (!card) return nullptr;
    KanbanCard* raw = card_box_->add_widget(std::move(card));
    cards_.push_back(raw);
    refresh_count();
    layout();
    return raw;
}

std::unique_ptr<KanbanCard> KanbanColumn::take_card(const std::string& card_id) {
    auto it = std::find_if(cards_.begin(), cards_.end(), [&card_id](const KanbanCard* c) { return c->id() == card_id; });
    if (it == cards_.end()) return nullptr;
    std::unique_ptr<Widget> owned = card_box_->take(*it);
    if (!owned) return nullptr;
    cards_.erase(it);
    refresh_count();
    layout();
    return std::unique_ptr<KanbanCard>(static_cast<KanbanCard*>(owned.release()));
}

bool KanbanColumn::remove_card(const std::string& card_id) {
    return take_card(card_id) != nullptr;
}

KanbanCard* KanbanColumn::get_card(const std::string& card_id) const {
    for (auto* c : cards_) {
        if (c->id() == card_id) return c;
    }
    return nullptr;
}

void KanbanColumn::refresh_count() {
    count_label_->set_text(std::to_string(cards_.size()));
}

int KanbanColumn::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : kWidth;
}

int KanbanColumn::height_for_width(int w) const {
    return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w);
}

void KanbanColumn::layout() { layout_->set_rect(rect_); }

bool KanbanColumn::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void KanbanColumn::update() { layout_->update(); }

void KanbanColumn::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("lg");
    const SDL_Color primary = tm.color("primary");
    if (drop_highlight_) {
        wk_draw::fill_rounded_rect(r, rect_, radius, wk::mix(tm.color("light"), primary, 0.12f), alpha);
        wk_draw::draw_rounded_rect(r, rect_, radius, primary, alpha);
        wk_draw::draw_rounded_rect(r, wk_draw::inset(rect_, 1, 1), radius - 1, primary, alpha);
    } else {
        wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("light"), alpha);
        wk_draw::draw_rounded_rect(r, rect_, radius, tm.color("border"), alpha);
    }
    const SDL_Rect pill = wk_draw::inset(count_label_->rect(), -8, -2);
    wk_draw::fill_rounded_rect(r, pill, pill.h / 2, tm.color("surface"), alpha);
    wk_draw::ClipScope clip(r, rect_);
    layout_->render(r);
}

KanbanBoard::KanbanBoard() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0)) {
    layout_->set_parent(this);
    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_margins(16, 12, 16, 12);
    header->set_alignment(BoxLayout::Align::Center);
    header->add_widget(std::make_unique<Label>("Kanban Board", "heading", "text"), 1);
    add_column_button_ = header->add_widget(
        std::make_unique<BaseButton>("Add Column", ButtonVariant::Primary, ButtonSize::Small));
    add_column_button_->set_on_clicked([this]() { add_new_column(); });
    header_ = layout_->add_widget(std::move(header));

    auto columns = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, kColumnSpacing);
    columns->set_margins(16);
    columns->set_alignment(BoxLayout::Align::Fill);
    column_box_ = layout_->add_widget(std::move(columns), 1);
}

KanbanBoard::~KanbanBoard() = default;

KanbanColumn* KanbanBoard::add_column(const std::string& title, const std::string& id) {
    std::string column_id = id;
    if (column_id.empty()) {
        do {
            column_id = "column_" + std::to_string(next_column_++);
        } while (find_column(column_id));
    } else if (find_column(column_id)) {
        return nullptr;
    }
    auto column = std::make_unique<KanbanColumn>(title, column_id);
    KanbanColumn* raw = column.get();
    raw->set_on_card_added([this, raw](const nlohmann::json& card) {
        const std::string target = raw->id();
        if (on_card_created_) {
            on_card_created_(target, card);
        } else {
            add_card(target, card.value("title", std::string{}), card.value("description", std::string{}));
        }
    });
    column_box_->add_widget(std::move(column));
    columns_.push_back(raw);
    layout();
    return raw;
}

bool KanbanBoard::remove_column(const std::string& id) {
    KanbanColumn* column = find_column(id);
    if (!column) return false;
    if (drag_card_ && card_column(drag_card_->id()) == id) drag_card_ = nullptr;
    if (drop_target_ == column) drop_target_ = nullptr;
    card_columns_.erase(std::remove_if(card_columns_.begin(), card_columns_.end(),
                                       [&id](const std::pair<std::string, std::string>& e) { return e.second == id; }),
                        card_columns_.end());
    columns_.erase(std::find(columns_.begin(), columns_.end(), column));
    column_box_->remove(column);
    layout();
    return true;
}

KanbanColumn* KanbanBoard::find_column(const std::string& id) const {
    for (auto* c : columns_) {
        if (c->id() == id) return c;
    }
    return nullptr;
}

KanbanCard* KanbanBoard::attach_card(KanbanColumn* column, std::unique_ptr<KanbanCard> card) {
    KanbanCard* raw = card.get();
    raw->set_on_clicked([this, raw]() {
        if (on_card_clicked_) on_card_clicked_(raw->id());
    });
    raw->set_on_double_clicked([this, raw]() {
        if (on_card_double_clicked_) on_card_double_clicked_(raw->id());
    });
    raw->set_on_drag_started([this](KanbanCard& c) { begin_drag(c); });
    column->add_card(std::move(card));
    card_columns_.emplace_back(raw->id(), column->id());
    layout();
    return raw;
}

KanbanCard* KanbanBoard::add_card(const std::string& column_id, const std::string& title,
                                  const std::string& description, const std::string& id) {
    KanbanColumn* column = find_column(column_id);
    if (!column) return nullptr;
    std::string card_id = id;
    if (card_id.empty()) {
        do {
            card_id = "card_" + std::to_string(next_card_++);
        } while (!card_column(card_id).empty());
    } else if (!card_column(card_id).empty()) {
        return nullptr;
    }
    return attach_card(column, std::make_unique<KanbanCard>(card_id, title, description));
}

bool KanbanBoard::remove_card(const std::string& card_id) {
    KanbanColumn* column = find_column(card_column(card_id));
    if (!column) return false;
    if (drag_card_ && drag_card_->id() == card_id) drag_card_ = nullptr;
    column->remove_card(card_id);
    card_columns_.erase(std::remove_if(card_columns_.begin(), card_columns_.end(),
                                       [&card_id](const std::pair<std::string, std::string>& e) {
                                           return e.first == card_id;
                                       }),
                        card_columns_.end());
    layout();
    return true;
}

KanbanCard* KanbanBoard::find_card(const std::string& card_id) const {
    KanbanColumn* column = find_column(card_column(card_id));
    return column ? column->get_card(card_id) : nullptr;
}

std::string KanbanBoard::card_column(const std::string& card_id) const {
    for (const auto& e : card_columns_) {
        if (e.first == card_id) return e.second;
    }
    return {};
}

bool KanbanBoard::move_card(const std::string& card_id, const std::string& to_column) {
    const std::string from = card_column(card_id);
    if (from.empty() || from == to_column) return false;
    KanbanColumn* source = find_column(from);
    KanbanColumn* target = find_column(to_column);
    if (!source || !target) return false;
    std::unique_ptr<KanbanCard> card = source->take_card(card_id);
    if (!card) return false;
    target->add_card(std::move(card));
    for (auto& e : card_columns_) {
        if (e.first == card_id) e.second = to_column;
    }
    layout();
    if (on_card_moved_) on_card_moved_(card_id, from, to_column);
    return true;
}

bool KanbanBoard::drop_payload(const std::string& payload, const std::string& column_id) {
    const std::string prefix = KanbanCard::kPayloadPrefix;
    if (payload.compare(0, prefix.size(), prefix) != 0) return false;
    return move_card(payload.substr(prefix.size()), column_id);
}

nlohmann::json KanbanBoard::get_board_data() const {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto* column : columns_) {
        nlohmann::json cards = nlohmann::json::array();
        for (const auto* card : column->cards()) cards.push_back(card->data());
        columns.push_back({ { "id", column->id() }, { "title", column->title() }, { "cards", cards } });
    }
    return nlohmann::json{ { "columns", columns } };
}

void KanbanBoard::clear_board() {
    drag_card_ = nullptr;
    drop_target_ = nullptr;
    column_box_->clear();
    columns_.clear();
    card_columns_.clear();
}

bool KanbanBoard::load_board_data(const nlohmann::json& data) {
    if (!data.is_object()) {
        std::cerr << "[KanbanBoard] Board data must be an object\n";
        return false;
    }
    try {
        const nlohmann::json columns = data.value("columns", nlohmann::json::array());
        if (!columns.is_array()) throw std::runtime_error("\"columns\" is not an array");
        clear_board();
        for (const auto& c : columns) {
            KanbanColumn* column = add_column(c.at("title").get<std::string>(), id_string(c.value("id", nlohmann::json())));
            if (!column) continue;
            for (const auto& card : c.value("cards", nlohmann::json::array())) {
                add_card(column->id(), card.at("title").get<std::string>(),
                         card.value("description", std::string{}), id_string(card.value("id", nlohmann::json())));
            }
        }
        layout();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[KanbanBoard] Invalid board data: " << e.what() << "\n";
        return false;
    }
}

bool KanbanBoard::save_to_file(const std::string& path) const {
    try {
        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + path + " for writing.");
        }
        out << get_board_data().dump(2);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[KanbanBoard] Failed to save board: " << e.what() << "\n";
        return false;
    }
}

bool KanbanBoard::load_from_file(const std::string& path) {
    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "[KanbanBoard] Unable to open board file " << path << "\n";
            return false;
        }
        nlohmann::json j;
        in >> j;
        if (!load_board_data(j)) return false;
        std::cout << "[KanbanBoard] Loaded " << columns_.size() << " columns from " << path << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[KanbanBoard] Failed to load " << path << ": " << e.what() << "\n";
        return false;
    }
}

void KanbanBoard::add_new_column() {
    const std::string title = "Column " + std::to_string(columns_.size() + 1);
    add_column(title);
    if (on_column_added_) on_column_added_(title);
}

KanbanColumn* KanbanBoard::column_at(SDL_Point p) const {
    for (auto* c : columns_) {
        if (c->is_visible() && wk::point_in(c->rect(), p)) return c;
    }
    return nullptr;
}

void KanbanBoard::begin_drag(KanbanCard& card) {
    drag_card_ = &card;
    set_drop_target(nullptr);
}

void KanbanBoard::set_drop_target(KanbanColumn* column) {
    if (column && drag_card_ && column->id() == card_column(drag_card_->id())) column = nullptr;
    if (column == drop_target_) return;
    if (drop_target_) drop_target_->set_drop_highlight(false);
    drop_target_ = column;
    if (drop_target_) drop_target_->set_drop_highlight(true);
}

void KanbanBoard::finish_drag(SDL_Point p) {
    KanbanCard* card = drag_card_;
    set_drop_target(nullptr);
    drag_card_ = nullptr;
    if (!card) return;
    card->end_drag();
    const std::string payload = card->drag_payload();
    if (KanbanColumn* target = column_at(p)) drop_payload(payload, target->id());
}

int KanbanBoard::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width();
}

int KanbanBoard::height_for_width(int w) const {
    return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w);
}

void KanbanBoard::layout() { layout_->set_rect(rect_); }

bool KanbanBoard::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (drag_card_) {
        if (e.type == SDL_MOUSEMOTION) {
            drag_point_ = wk::event_point(e);
            set_drop_target(column_at(drag_point_));
        } else if (wk::is_left_release(e)) {
            finish_drag(wk::event_point(e));
        } else if (wk::is_key(e, SDLK_ESCAPE)) {
            KanbanCard* card = drag_card_;
            set_drop_target(nullptr);
            drag_card_ = nullptr;
            card->end_drag();
        }
        return true;
    }
    track_hover(e);
    const bool handled = layout_->handle_event(e);
    if (drag_card_ && e.type == SDL_MOUSEMOTION) {
        drag_point_ = wk::event_point(e);
        set_drop_target(column_at(drag_point_));
    }
    return handled;
}

void KanbanBoard::update() { layout_->update(); }

void KanbanBoard::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("background"), alpha);
    const SDL_Rect band = header_->rect();
    wk_draw::fill_rect(r, band, tm.color("surface"), alpha);
    wk_draw::fill_rect(r, SDL_Rect{ band.x, band.y + band.h - 1, band.w, 1 }, tm.color("border"), alpha);
    {
        wk_draw::ClipScope clip(r, rect_);
        layout_->render(r);
    }
    if (!drag_card_) return;
    const int radius = tm.border_radius("md");
    const int w = std::min(kGhostWidth, drag_card_->rect().w);
    const SDL_Rect ghost{ drag_point_.x - w / 2, drag_point_.y - kGhostHeight / 2, w, kGhostHeight };
    wk_draw::draw_shadow(r, ghost, radius, 4, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, ghost, radius, tm.color("surface"), alpha);
    wk_draw::draw_rounded_rect(r, ghost, radius, tm.color("primary"), alpha);
    LabelStyle st = Styles::Label("default", "text");
    st.bold = true;
    const SDL_Rect text_area = wk_draw::inset(ghost, 12, 0);
    wk_text::draw_in_rect(r, st, wk_text::elide(st, drag_card_->title(), text_area.w), text_area,
                          wk_text::Align::Left, alpha);
}
