#include "search_box.hpp"

#include <algorithm>
#include <cstdlib>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kTextPad = 10;
constexpr int kSelectorGap = 8;
}

SuggestionList::~SuggestionList() {
    OverlayManager::instance().close(this);
}

void SuggestionList::set_rows(const std::vector<Row>& rows) {
    rows_ = rows;
    highlighted_ = -1;
    first_ = 0;
}

void SuggestionList::set_items(const std::vector<std::string>& items) {
    std::vector<Row> rows;
    rows.reserve(items.size());
    for (const std::string& s : items) rows.push_back(Row{ s, false });
    set_rows(rows);
}

size_t SuggestionList::selectable_count() const {
    return static_cast<size_t>(std::count_if(rows_.begin(), rows_.end(), [](const Row& r) { return !r.header; }));
}

void SuggestionList::move_highlight(int delta) {
    const int n = static_cast<int>(rows_.size());
    if (n == 0 || selectable_count() == 0 || delta == 0) return;
    const int step = delta > 0 ? 1 : -1;
    int idx = highlighted_;
    if (idx < 0) idx = step > 0 ? -1 : n;
    for (int moved = 0; moved < std::abs(delta);) {
        idx = (idx + step + n) % n;
        if (!rows_[static_cast<size_t>(idx)].header) ++moved;
    }
    set_highlighted(idx);
}

void SuggestionList::set_highlighted(int row) {
    if (row < 0 || row >= static_cast<int>(rows_.size()) || rows_[static_cast<size_t>(row)].header) {
        highlighted_ = -1;
        return;
    }
    highlighted_ = row;
    scroll_to(row);
}

void SuggestionList::scroll_to(int row) {
    if (row < first_) first_ = row;
    if (row >= first_ + visible_rows()) first_ = row - visible_rows() + 1;
}

bool SuggestionList::choose_highlighted() {
    if (highlighted_ < 0) return false;
    if (on_chosen_) on_chosen_(highlighted_);
    return true;
}

int SuggestionList::visible_rows() const {
    return std::min(static_cast<int>(rows_.size()), kMaxHeight / kItemHeight);
}

void SuggestionList::open_below(const SDL_Rect& anchor) {
    OverlayManager& overlays = OverlayManager::instance();
    SDL_Rect area{ anchor.x, anchor.y + anchor.h + 2, anchor.w, visible_rows() * kItemHeight + 2 };
    set_rect(overlays.clamp_to_screen(area));
    show();
    overlays.open(this, OverlayManager::Mode::Passive);
}

void SuggestionList::close() {
    hide();
    OverlayManager::instance().close(this);
}

bool SuggestionList::is_open() const {
    return visible_ && OverlayManager::instance().is_open(this);
}

SDL_Rect SuggestionList::row_rect(int row) const {
    return SDL_Rect{ rect_.x + 1, rect_.y + 1 + (row - first_) * kItemHeight, rect_.w - 2, kItemHeight };
}

int SuggestionList::row_at(SDL_Point p) const {
    if (!wk::point_in(rect_, p)) return -1;
    const int row = first_ + (p.y - rect_.y - 1) / kItemHeight;
    if (row < 0 || row >= static_cast<int>(rows_.size())) return -1;
    return row;
}

bool SuggestionList::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        const int row = row_at(SDL_Point{ e.motion.x, e.motion.y });
        if (row >= 0 && !rows_[static_cast<size_t>(row)].header) highlighted_ = row;
        return row >= 0;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!wk::point_in(rect_, wk::event_point(e))) return false;
        const int max_first = std::max(0, static_cast<int>(rows_.size()) - visible_rows());
        first_ = std::max(0, std::min(max_first, first_ - e.wheel.y));
        return true;
    }
    if (wk::is_left_press(e)) {
        const int row = row_at(SDL_Point{ e.button.x, e.button.y });
        if (row < 0) return false;
        if (!rows_[static_cast<size_t>(row)].header && on_chosen_) on_chosen_(row);
        return true;
    }
    if (wk::is_left_release(e)) return wk::point_in(rect_, SDL_Point{ e.button.x, e.button.y });
    return false;
}

void SuggestionList::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const TextBoxStyle st = Styles::TextBox();
    const ThemeManager& tm = ThemeManager::instance();
    const int radius = tm.border_radius("sm");
    wk_draw::draw_shadow(r, rect_, radius, 4, wk::rgba(0, 0, 0, 40));
    wk_draw::fill_rounded_rect(r, rect_, radius, st.bg);
    wk_draw::draw_rounded_rect(r, rect_, radius, st.border);
    LabelStyle item_style = st.label;
    item_style.color = st.text;
    LabelStyle header_style = Styles::Label("caption", "text_secondary");
    header_style.bold = true;
    wk_draw::ClipScope clip(r, rect_);
    const int n = static_cast<int>(rows_.size());
    for (int i = first_; i < n && i < first_ + visible_rows(); ++i) {
        const Row& row = rows_[static_cast<size_t>(i)];
        const SDL_Rect rr = row_rect(i);
        if (i == highlighted_) wk_draw::fill_rect(r, rr, tm.color("hover"));
        const SDL_Rect text_rect{ rr.x + kTextPad, rr.y, rr.w - 2 * kTextPad, rr.h };
        const LabelStyle& s = row.header ? header_style : item_style;
        wk_text::draw_in_rect(r, s, wk_text::elide(s, row.text, text_rect.w), text_rect);
    }
}

SearchBoxWithSuggestions::SearchBoxWithSuggestions(const std::string& placeholder)
    : input_(std::make_unique<TextBox>(std::string(), placeholder)), list_(std::make_unique<SuggestionList>()) {
    input_->set_parent(this);
    list_->hide();
    list_->set_on_chosen([this](int row) { row_chosen(row); });
    input_->set_on_text_changed([this](const std::string& t) { text_edited(t); });
    input_->set_on_submitted([this](const std::string&) {
        if (is_list_open() && list_->choose_highlighted()) return;
        search();
    });
    input_->set_on_focus_changed([this](bool focused) {
        if (!focused) {
            list_->close();
        } else if (input_->text().empty()) {
            refresh();
        }
    });
    input_->set_key_filter([this](const SDL_Event& e) {
        if (!is_list_open()) return false;
        switch (e.key.keysym.sym) {
        case SDLK_DOWN:
            list_->move_highlight(1);
            return true;
        case SDLK_UP:
            list_->move_highlight(-1);
            return true;
        case SDLK_ESCAPE:
            list_->close();
            return true;
        default:
            return false;
        }
    });
    debounce_.set_on_timeout([this]() {
        const std::string q = wk_text::trim(input_->text());
        if (!q.empty() && wk_text::utf8_length(q) >= min_chars_ && on_search_requested_) on_search_requested_(q);
    });
}

SearchBoxWithSuggestions::~SearchBoxWithSuggestions() = default;

void SearchBoxWithSuggestions::set_suggestions(const std::vector<std::string>& s) {
    suggestions_ = s;
    if (!input_->text().empty()) refresh();
}

void SearchBoxWithSuggestions::add_suggestion(const std::string& s) {
    if (std::find(suggestions_.begin(), suggestions_.end(), s) != suggestions_.end()) return;
    suggestions_.push_back(s);
}

void SearchBoxWithSuggestions::clear_suggestions() {
    suggestions_.clear();
    filtered_.clear();
    list_->close();
}

void SearchBoxWithSuggestions::set_placeholder(const std::string& p) {
    input_->set_placeholder(p);
}

void SearchBoxWithSuggestions::set_text(const std::string& t) {
    suppress_ = true;
    input_->set_text(t);
    suppress_ = false;
}

const std::string& SearchBoxWithSuggestions::text() const {
    return input_->text();
}

void SearchBoxWithSuggestions::clear() {
    set_text(std::string());
    debounce_.stop();
    filtered_.clear();
    list_->close();
}

bool SearchBoxWithSuggestions::is_list_open() const {
    return list_->is_open();
}

std::vector<std::string> SearchBoxWithSuggestions::compute_matches(const std::string& query) const {
    std::vector<std::string> out;
    const std::string q = wk_text::to_lower(query);
    for (const std::string& s : suggestions_) {
        if (out.size() >= max_suggestions_) break;
        if (wk_text::to_lower(s).find(q) != std::string::npos) out.push_back(s);
    }
    return out;
}

void SearchBoxWithSuggestions::refresh() {
    const std::string& q = input_->text();
    filtered_.clear();
    if (q.empty()) {
        show_rows(idle_rows());
        return;
    }
    if (wk_text::utf8_length(q) < min_chars_) {
        show_rows({});
        return;
    }
    filtered_ = compute_matches(q);
    std::vector<SuggestionList::Row> rows;
    for (const std::string& s : filtered_) rows.push_back(SuggestionList::Row{ s, false });
    show_rows(rows);
}

void SearchBoxWithSuggestions::show_rows(const std::vector<SuggestionList::Row>& rows) {
    shown_ = rows;
    if (rows.empty()) {
        list_->close();
        return;
    }
    list_->set_rows(rows);
    list_->open_below(input_->box_rect());
}

void SearchBoxWithSuggestions::text_edited(const std::string& t) {
    if (suppress_) return;
    if (on_text_changed_) on_text_changed_(t);
    refresh();
    debounce_.stop();
    if (!t.empty() && wk_text::utf8_length(t) >= min_chars_) debounce_.start(delay_ms_);
}

void SearchBoxWithSuggestions::row_chosen(int row) {
    if (row < 0 || row >= static_cast<int>(shown_.size())) return;
    const std::string chosen = shown_[static_cast<size_t>(row)].text;
    set_text(chosen);
    debounce_.stop();
    list_->close();
    if (on_suggestion_selected_) on_suggestion_selected_(chosen);
}

void SearchBoxWithSuggestions::select_suggestion(size_t index) {
    if (index >= filtered_.size()) return;
    const std::string chosen = filtered_[index];
    set_text(chosen);
    debounce_.stop();
    list_->close();
    if (on_suggestion_selected_) on_suggestion_selected_(chosen);
}

void SearchBoxWithSuggestions::search() {
    debounce_.stop();
    const std::string q = wk_text::trim(input_->text());
    if (q.empty()) return;
    list_->close();
    emit_search(q);
}

void SearchBoxWithSuggestions::emit_search(const std::string& query) {
    if (wk_text::utf8_length(query) < min_chars_) return;
    on_search(query);
    if (on_search_requested_) on_search_requested_(query);
}

int SearchBoxWithSuggestions::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 260;
}

int SearchBoxWithSuggestions::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return TextBox::height();
}

void SearchBoxWithSuggestions::layout() {
    input_->set_rect(rect_);
    if (is_list_open()) list_->open_below(input_->box_rect());
}

bool SearchBoxWithSuggestions::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return input_->handle_event(e);
}

void SearchBoxWithSuggestions::update() {
    debounce_.poll();
}

void SearchBoxWithSuggestions::render(SDL_Renderer* r) const {
    if (!visible_) return;
    input_->render(r);
}

RecentSearchBox::RecentSearchBox(const std::string& placeholder) : SearchBoxWithSuggestions(placeholder) {}

std::vector<SuggestionList::Row> RecentSearchBox::idle_rows() const {
    std::vector<SuggestionList::Row> rows;
    if (recent_.empty()) return rows;
    rows.push_back(SuggestionList::Row{ "Recent searches", true });
    for (const std::string& s : recent_) rows.push_back(SuggestionList::Row{ s, false });
    return rows;
}

void RecentSearchBox::show_recent() {
    show_rows(idle_rows());
}

void RecentSearchBox::on_search(const std::string& query) {
    recent_.erase(std::remove(recent_.begin(), recent_.end(), query), recent_.end());
    recent_.insert(recent_.begin(), query);
    if (recent_.size() > kMaxRecent) recent_.resize(kMaxRecent);
}

HistorySearchBox::HistorySearchBox(const std::string& placeholder) : SearchBoxWithSuggestions(placeholder) {}

void HistorySearchBox::load_history(const std::vector<std::string>& history) {
    history_.assign(history.begin(), history.begin() + static_cast<std::ptrdiff_t>(std::min(history.size(), kMaxHistory)));
}

void HistorySearchBox::on_search(const std::string& query) {
    history_.erase(std::remove(history_.begin(), history_.end(), query), history_.end());
    history_.insert(history_.begin(), query);
    if (history_.size() > kMaxHistory) history_.resize(kMaxHistory);
}

CategorizedSearchBox::CategorizedSearchBox(const std::string& placeholder)
    : SearchBoxWithSuggestions(placeholder),
      selector_(std::make_unique<Dropdown>(std::vector<std::string>{ "All categories" }, 0)) {
    selector_->set_parent(this);
    selector_->set_on_changed([this](int idx, const std::string& text) {
        category_ = idx <= 0 ? std::string() : text;
        if (on_category_changed_) on_category_changed_(category_);
        if (!input_->text().empty()) refresh();
    });
}

CategorizedSearchBox::~CategorizedSearchBox() = default;

void CategorizedSearchBox::add_category(const std::string& name, const std::vector<std::string>& items) {
    for (auto& c : categories_) {
        if (c.first == name) {
            c.second = items;
            return;
        }
    }
    categories_.emplace_back(name, items);
    selector_->add_option(name);
}

void CategorizedSearchBox::set_category(const std::string& name) {
    if (name.empty()) {
        selector_->set_selected(0);
        return;
    }
    for (size_t i = 0; i < categories_.size(); ++i) {
        if (categories_[i].first == name) {
            selector_->set_selected(static_cast<int>(i) + 1);
            return;
        }
    }
}

std::vector<std::string> CategorizedSearchBox::categories() const {
    std::vector<std::string> out;
    for (const auto& c : categories_) out.push_back(c.first);
    return out;
}

std::vector<std::string> CategorizedSearchBox::compute_matches(const std::string& query) const {
    std::vector<std::string> out;
    const std::string q = wk_text::to_lower(query);
    for (const auto& c : categories_) {
        if (!category_.empty() && c.first != category_) continue;
        for (const std::string& item : c.second) {
            if (out.size() >= max_suggestions()) return out;
            const std::string entry = c.first + ": " + item;
            if (wk_text::to_lower(entry).find(q) != std::string::npos) out.push_back(entry);
        }
    }
    return out;
}

int CategorizedSearchBox::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return kSelectorWidth + kSelectorGap + SearchBoxWithSuggestions::preferred_width();
}

int CategorizedSearchBox::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return std::max(selector_->height_for_width(kSelectorWidth), SearchBoxWithSuggestions::height_for_width(w));
}

void CategorizedSearchBox::layout() {
    selector_->set_rect(SDL_Rect{ rect_.x, rect_.y, kSelectorWidth, rect_.h });
    const int x = rect_.x + kSelectorWidth + kSelectorGap;
    input_->set_rect(SDL_Rect{ x, rect_.y, std::max(0, rect_.x + rect_.w - x), rect_.h });
}

bool CategorizedSearchBox::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (selector_->handle_event(e)) return true;
    return SearchBoxWithSuggestions::handle_event(e);
}

void CategorizedSearchBox::render(SDL_Renderer* r) const {
    if (!visible_) return;
    selector_->render(r);
    SearchBoxWithSuggestions::render(r);
}
