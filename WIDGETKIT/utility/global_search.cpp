#include "global_search.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <iostream>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRowPadX = 12;
constexpr int kRowHeight = 36;
constexpr int kRowHeightWithDescription = 54;
constexpr int kPanelWidth = 420;
constexpr int kPanelHeight = 440;
constexpr int kClearSize = 24;

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string score_text(double score) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", score);
    return buf;
}
}

SearchResultRow::SearchResultRow(const SearchResult& result) : result_(result) {}

int SearchResultRow::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    LabelStyle st = Styles::Label("default", "text");
    st.bold = true;
    return wk_text::width(st, result_.title) + 2 * kRowPadX;
}

int SearchResultRow::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return result_.description.empty() ? kRowHeight : kRowHeightWithDescription;
}

bool SearchResultRow::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Clicked:
        if (on_clicked_) {
            // The handler may clear the list this row belongs to.
            auto cb = on_clicked_;
            cb();
        }
        return true;
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::None:
    default:
        return false;
    }
}

void SearchResultRow::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    if (selected_) wk_draw::fill_rect(r, rect_, tm.color("primary"), alpha);
    else if (hovered_) wk_draw::fill_rect(r, rect_, tm.color("hover"), alpha);
    wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);

    const SDL_Color fg = selected_ ? wk::rgba(255, 255, 255) : tm.color("text");
    const SDL_Color fg2 = selected_ ? wk::rgba(255, 255, 255) : tm.color("text_secondary");
    int right = rect_.x + rect_.w - kRowPadX;
    if (result_.score > 0.0) {
        LabelStyle sst = Styles::Label("caption", "text_secondary");
        sst.color = fg2;
        const std::string s = score_text(result_.score);
        const int w = wk_text::width(sst, s);
        wk_text::draw_in_rect(r, sst, s, SDL_Rect{ right - w, rect_.y, w, rect_.h }, wk_text::Align::Right, alpha);
        right -= w + 12;
    }
    const int x = rect_.x + kRowPadX;
    const int text_w = std::max(0, right - x);
    LabelStyle title_style = Styles::Label("default", "text");
    title_style.color = fg;
    title_style.bold = true;
    const std::string title = result_.title.empty() ? "Untitled" : result_.title;
    if (result_.description.empty()) {
        wk_text::draw_in_rect(r, title_style, wk_text::elide(title_style, title, text_w),
                              SDL_Rect{ x, rect_.y, text_w, rect_.h }, wk_text::Align::Left, alpha);
        return;
    }
    LabelStyle desc_style = Styles::Label("caption", "text_secondary");
    desc_style.color = fg2;
    const int th = wk_text::line_height(title_style);
    const int dh = wk_text::line_height(desc_style);
    const int top = rect_.y + (rect_.h - th - dh - 2) / 2;
    wk_text::draw(r, title_style, wk_text::elide(title_style, title, text_w), x, top, alpha);
    wk_text::draw(r, desc_style, wk_text::elide(desc_style, result_.description, text_w), x, top + th + 2, alpha);
}

GlobalSearch::GlobalSearch(const std::string& placeholder)
    : search_timer_(true), layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
    layout_->set_margins(8);

    auto search_row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    search_row->set_alignment(BoxLayout::Align::Center);
    search_row->add_widget(std::make_unique<IconGlyph>("search", 18, "text_secondary"));
    search_ = search_row->add_widget(std::make_unique<TextBox>("", placeholder), 1);
    search_->set_on_text_changed([this](const std::string& text) { on_text_changed(text); });
    search_->set_on_submitted([this](const std::string& text) {
        if (wk_text::trim(text) != searched_query_ || search_timer_.is_active()) search_now();
        else activate_selected();
    });
    search_->set_on_escape([this]() { clear_search(); });
    search_->set_key_filter([this](const SDL_Event& e) {
        if (wk::is_key(e, SDLK_DOWN)) {
            select_next();
            return true;
        }
        if (wk::is_key(e, SDLK_UP)) {
            select_previous();
            return true;
        }
        return false;
    });
    clear_button_ = search_row->add_widget(std::make_unique<IconButton>("close", kClearSize));
    clear_button_->set_tooltip("Clear search");
    clear_button_->set_on_clicked([this]() { clear_search(); });
    clear_button_->hide();
    layout_->add_widget(std::move(search_row));

    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    list_ = list.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(list)), 1);

    status_label_ = layout_->add_widget(std::make_unique<Label>("Type to search...", "caption", "text_secondary"));

    search_timer_.set_on_timeout([this]() { search_now(); });
}

GlobalSearch::~GlobalSearch() = default;

void GlobalSearch::add_provider(const std::string& name, SearchProvider provider) {
    if (name.empty() || !provider) return;
    for (auto& p : providers_) {
        if (p.name == name) {
            p.fn = std::move(provider);
            return;
        }
    }
    providers_.push_back(Provider{ name, std::move(provider) });
}

bool GlobalSearch::remove_provider(const std::string& name) {
    auto it = std::find_if(providers_.begin(), providers_.end(), [&name](const Provider& p) { return p.name == name; });
    if (it == providers_.end()) return false;
    providers_.erase(it);
    if (provider_filter_ == name) provider_filter_.clear();
    return true;
}

std::vector<std::string> GlobalSearch::providers() const {
    std::vector<std::string> out;
    for (const auto& p : providers_) out.push_back(p.name);
    return out;
}

void GlobalSearch::set_provider_filter(const std::string& name) {
    if (provider_filter_ == name) return;
    provider_filter_ = name;
    if (!searched_query_.empty()) search_now();
}

void GlobalSearch::set_query(const std::string& text) { search_->set_text(text); }

std::string GlobalSearch::query() const { return search_->text(); }

void GlobalSearch::on_text_changed(const std::string& text) {
    if (clearing_) return;
    if (wk_text::trim(text).empty()) {
        clear_search();
        return;
    }
    clear_button_->show();
    search_timer_.start(kDebounceMs);
    layout();
}

void GlobalSearch::search_now() {
    search_timer_.stop();
    const std::string q = wk_text::trim(search_->text());
    if (wk_text::utf8_length(q) < kMinQueryLength) {
        clear_results();
        status_label_->set_text(q.empty() ? "Type to search..." : "Type at least 2 characters");
        return;
    }
    results_.clear();
    for (const auto& p : providers_) {
        if (!provider_filter_.empty() && p.name != provider_filter_) continue;
        try {
            std::vector<SearchResult> found = p.fn(q);
            for (auto& result : found) {
                result.provider = p.name;
                results_.push_back(std::move(result));
            }
        } catch (const std::exception& ex) {
            std::cerr << "[GlobalSearch] Search error in " << p.name << ": " << ex.what() << "\n";
        }
    }
    searched_query_ = q;
    selected_ = results_.empty() ? -1 : 0;
    rebuild();
    status_label_->set_text("Found " + std::to_string(results_.size()) + " results");
    if (on_search_performed_) on_search_performed_(q);
}

void GlobalSearch::clear_results() {
    results_.clear();
    searched_query_.clear();
    selected_ = -1;
    rebuild();
}

void GlobalSearch::clear_search() {
    search_timer_.stop();
    clearing_ = true;
    search_->set_text(std::string());
    clearing_ = false;
    clear_results();
    clear_button_->hide();
    status_label_->set_text("Type to search...");
    layout();
    if (on_search_cleared_) on_search_cleared_();
}

void GlobalSearch::rebuild() {
    list_->clear();
    rows_.clear();
    std::string current;
    for (size_t i = 0; i < results_.size(); ++i) {
        const SearchResult& result = results_[i];
        if (i == 0 || result.provider != current) {
            current = result.provider;
            auto caption = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
            caption->set_margins(kRowPadX, 8, kRowPadX, 4);
            auto* label = caption->add_widget(std::make_unique<Label>(upper(current), "caption", "primary"));
            label->set_bold(true);
            list_->add(std::move(caption));
        }
        auto* row = list_->add_widget(std::make_unique<SearchResultRow>(result));
        const int index = static_cast<int>(i);
        row->set_selected(index == selected_);
        row->set_on_clicked([this, index]() {
            set_selected_index(index);
            activate_selected();
        });
        rows_.push_back(row);
    }
    scroll_->scroll_to_top();
    layout();
}

SearchResultRow* GlobalSearch::row(int index) const {
    if (index < 0 || index >= static_cast<int>(rows_.size())) return nullptr;
    return rows_[static_cast<size_t>(index)];
}

void GlobalSearch::set_selected_index(int index) {
    if (index < 0 || index >= result_count()) return;
    selected_ = index;
    for (size_t i = 0; i < rows_.size(); ++i) rows_[i]->set_selected(static_cast<int>(i) == selected_);
    scroll_->ensure_visible(rows_[static_cast<size_t>(selected_)]->rect());
}

void GlobalSearch::select_next() {
    if (results_.empty()) return;
    set_selected_index(selected_ < result_count() - 1 ? selected_ + 1 : 0);
}

void GlobalSearch::select_previous() {
    if (results_.empty()) return;
    set_selected_index(selected_ > 0 ? selected_ - 1 : result_count() - 1);
}

bool GlobalSearch::activate_selected() {
    if (selected_ < 0 || selected_ >= result_count()) return false;
    const SearchResult result = results_[static_cast<size_t>(selected_)];
    if (on_result_selected_) on_result_selected_(result.provider, result);
    return true;
}

const std::string& GlobalSearch::status_text() const { return status_label_->text(); }

void GlobalSearch::set_placeholder(const std::string& placeholder) { search_->set_placeholder(placeholder); }

void GlobalSearch::focus_search() { search_->set_focus(true); }

int GlobalSearch::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kPanelWidth, layout_->preferred_width());
}

int GlobalSearch::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kPanelHeight;
}

void GlobalSearch::layout() { layout_->set_rect(rect_); }

bool GlobalSearch::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void GlobalSearch::update() {
    search_timer_.poll();
    layout_->update();
}

void GlobalSearch::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    const SDL_Rect list = scroll_->rect();
    wk_draw::fill_rect(r, list, tm.color("background"), alpha);
    wk_draw::draw_rect(r, list, tm.color("border"), alpha);
    layout_->render(r);
    if (results_.empty() && !searched_query_.empty()) {
        wk_text::draw_in_rect(r, Styles::Label("default", "text_secondary"), "No results", list,
                              wk_text::Align::Center, alpha);
    }
}
