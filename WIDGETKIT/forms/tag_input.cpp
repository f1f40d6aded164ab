#include "tag_input.hpp"

#include <algorithm>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kChipPadLeft = 8;
constexpr int kChipPadRight = 4;
constexpr int kChipSpacing = 4;
constexpr int kSectionGap = 4;

bool is_separator(char c) {
    return c == ',' || c == ';';
}
}

namespace wk {
int flow_layout(const std::vector<Widget*>& items, const SDL_Rect& area, int gap, bool apply) {
    int x = area.x;
    int y = area.y;
    int row_h = 0;
    bool any = false;
    for (Widget* w : items) {
        if (!w->is_visible()) continue;
        const int iw = std::min(area.w, w->preferred_width());
        const int ih = w->height_for_width(iw);
        if (any && x + iw > area.x + area.w) {
            x = area.x;
            y += row_h + gap;
            row_h = 0;
        }
        if (apply) w->set_rect(SDL_Rect{ x, y, iw, ih });
        x += iw + gap;
        row_h = std::max(row_h, ih);
        any = true;
    }
    return any ? y + row_h - area.y : 0;
}
}

TagChip::TagChip(const std::string& text, bool removable) : text_(text), removable_(removable) {}

SDL_Rect TagChip::close_rect() const {
    if (!removable_) return SDL_Rect{ 0, 0, 0, 0 };
    return SDL_Rect{ rect_.x + rect_.w - kChipPadRight - kCloseSize, rect_.y + (rect_.h - kCloseSize) / 2, kCloseSize,
                     kCloseSize };
}

int TagChip::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int text_w = wk_text::width(Styles::Label("caption"), text_);
    const int trailing = removable_ ? kChipSpacing + kCloseSize + kChipPadRight : kChipPadLeft;
    return std::min(kMaxWidth, kChipPadLeft + text_w + trailing);
}

int TagChip::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : kHeight;
}

bool TagChip::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (removable_) {
        const SDL_Rect cr = close_rect();
        if (e.type == SDL_MOUSEMOTION) close_hovered_ = wk::point_in(cr, SDL_Point{ e.motion.x, e.motion.y });
        switch (close_click_.feed(e, cr)) {
        case ClickTracker::Result::Clicked:
            if (on_remove_) on_remove_();
            return true;
        case ClickTracker::Result::Pressed:
        case ClickTracker::Result::Released:
            return true;
        default:
            break;
        }
    }
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Clicked:
        if (on_clicked_) on_clicked_();
        return true;
    case ClickTracker::Result::Pressed:
        return true;
    default:
        return false;
    }
}

void TagChip::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = rect_.h / 2;
    LabelStyle st = Styles::Label("caption");
    if (has_color_) {
        wk_draw::fill_rounded_rect(r, rect_, radius, color_, alpha);
        st.color = wk::rgba(255, 255, 255);
    } else {
        wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("surface"), alpha);
        wk_draw::draw_rounded_rect(r, rect_, radius, tm.color("border"), alpha);
    }
    const int right = removable_ ? kChipSpacing + kCloseSize + kChipPadRight : kChipPadLeft;
    const SDL_Rect text_area{ rect_.x + kChipPadLeft, rect_.y, std::max(0, rect_.w - kChipPadLeft - right), rect_.h };
    wk_text::draw_in_rect(r, st, wk_text::elide(st, text_, text_area.w), text_area, wk_text::Align::Left, alpha);
    if (removable_) {
        const SDL_Rect cr = close_rect();
        if (close_hovered_) {
            wk_draw::fill_circle(r, cr.x + cr.w / 2, cr.y + cr.h / 2, cr.w / 2, wk::rgba(0, 0, 0, 30), alpha);
        }
        wk_draw::draw_cross(r, wk_draw::inset(cr, 4, 4), st.color, alpha);
    }
}

TagInput::TagInput(const std::string& placeholder, const std::vector<std::string>& suggestions, size_t max_tags)
    : placeholder_(placeholder), input_(std::make_unique<TextBox>(std::string(), placeholder)),
      suggestions_(suggestions), max_tags_(max_tags) {
    input_->set_parent(this);
    input_->set_on_submitted([this](const std::string&) {
        if (highlighted_ >= 0 && highlighted_ < static_cast<int>(filtered_.size())) {
            const std::string pick = filtered_[static_cast<size_t>(highlighted_)];
            add_tag(pick);
            input_->clear();
            return;
        }
        commit_input();
    });
    input_->set_on_text_changed([this](const std::string&) { refresh_suggestions(); });
    input_->set_key_filter([this](const SDL_Event& e) {
        const SDL_Keycode key = e.key.keysym.sym;
        if (key == SDLK_BACKSPACE && input_->text().empty()) {
            if (!tags_.empty()) remove_tag(tags_.back());
            return true;
        }
        if (filtered_.empty()) return false;
        const int n = static_cast<int>(filtered_.size());
        if (key == SDLK_DOWN) {
            highlighted_ = (highlighted_ + 1) % n;
            return true;
        }
        if (key == SDLK_UP) {
            highlighted_ = highlighted_ <= 0 ? n - 1 : highlighted_ - 1;
            return true;
        }
        if (key == SDLK_ESCAPE) {
            filtered_.clear();
            highlighted_ = -1;
            layout();
            return true;
        }
        return false;
    });
}

TagInput::~TagInput() = default;

bool TagInput::has_tag(const std::string& tag) const {
    return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

TagChip* TagInput::chip(const std::string& tag) const {
    for (const auto& c : chips_) {
        if (c->text() == tag) return c.get();
    }
    return nullptr;
}

bool TagInput::add_tag(const std::string& tag) {
    if (tag.empty() || has_tag(tag)) return false;
    if (max_tags_ > 0 && tags_.size() >= max_tags_) return false;
    tags_.push_back(tag);
    auto c = std::make_unique<TagChip>(tag);
    c->set_on_remove([this, tag]() { pending_removal_ = tag; });
    on_chip_created(*c);
    chips_.push_back(std::move(c));
    update_placeholder();
    refresh_suggestions();
    layout();
    if (on_tag_added_) on_tag_added_(tag);
    if (on_tags_changed_) on_tags_changed_(tags_);
    return true;
}

bool TagInput::remove_tag(const std::string& name) {
    // `name` may refer into tags_.
    const std::string tag = name;
    auto it = std::find(tags_.begin(), tags_.end(), tag);
    if (it == tags_.end()) return false;
    tags_.erase(it);
    chips_.erase(std::remove_if(chips_.begin(), chips_.end(),
                                [&](const std::unique_ptr<TagChip>& c) { return c->text() == tag; }),
                 chips_.end());
    update_placeholder();
    layout();
    if (on_tag_removed_) on_tag_removed_(tag);
    if (on_tags_changed_) on_tags_changed_(tags_);
    return true;
}

void TagInput::clear_tags() {
    const std::vector<std::string> copy = tags_;
    for (const std::string& t : copy) remove_tag(t);
}

void TagInput::set_tags(const std::vector<std::string>& tags) {
    clear_tags();
    for (const std::string& t : tags) add_tag(t);
}

void TagInput::set_suggestions(const std::vector<std::string>& s) {
    suggestions_ = s;
    refresh_suggestions();
}

void TagInput::set_max_tags(size_t n) {
    max_tags_ = n;
    if (n == 0) return;
    while (tags_.size() > n) remove_tag(tags_.back());
}

void TagInput::set_placeholder(const std::string& p) {
    placeholder_ = p;
    update_placeholder();
}

void TagInput::update_placeholder() {
    input_->set_placeholder(tags_.empty() ? placeholder_ : "Add more tags...");
}

void TagInput::commit_input() {
    const std::string text = wk_text::trim(input_->text());
    if (!text.empty()) add_tag(text);
    input_->clear();
}

void TagInput::refresh_suggestions() {
    filtered_.clear();
    highlighted_ = -1;
    const std::string query = wk_text::to_lower(input_->text());
    if (!query.empty()) {
        for (const std::string& s : suggestions_) {
            if (has_tag(s)) continue;
            if (wk_text::to_lower(s).find(query) == std::string::npos) continue;
            filtered_.push_back(s);
            if (filtered_.size() >= static_cast<size_t>(kMaxSuggestions)) break;
        }
    }
    layout();
}

void TagInput::flush_pending_removal() {
    if (pending_removal_.empty()) return;
    const std::string tag = pending_removal_;
    pending_removal_.clear();
    remove_tag(tag);
}

std::vector<Widget*> TagInput::chip_widgets() const {
    std::vector<Widget*> out;
    out.reserve(chips_.size());
    for (const auto& c : chips_) out.push_back(c.get());
    return out;
}

int TagInput::chips_height(int w) const {
    return wk::flow_layout(chip_widgets(), SDL_Rect{ 0, 0, w, 0 }, kChipGap, false);
}

int TagInput::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 260;
}

int TagInput::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int ch = chips_height(w);
    return ch + (ch > 0 ? kSectionGap : 0) + TextBox::height() +
           static_cast<int>(filtered_.size()) * kSuggestionHeight;
}

void TagInput::layout() {
    const int ch = wk::flow_layout(chip_widgets(), rect_, kChipGap);
    const int y = rect_.y + ch + (ch > 0 ? kSectionGap : 0);
    input_->set_rect(SDL_Rect{ rect_.x, y, rect_.w, TextBox::height() });
}

SDL_Rect TagInput::suggestion_rect(int idx) const {
    const SDL_Rect& box = input_->rect();
    return SDL_Rect{ box.x, box.y + box.h + idx * kSuggestionHeight, box.w, kSuggestionHeight };
}

bool TagInput::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (wk::is_left_press(e)) {
        const SDL_Point p{ e.button.x, e.button.y };
        for (size_t i = 0; i < filtered_.size(); ++i) {
            if (!wk::point_in(suggestion_rect(static_cast<int>(i)), p)) continue;
            const std::string pick = filtered_[i];
            add_tag(pick);
            input_->clear();
            return true;
        }
    }
    if (e.type == SDL_TEXTINPUT && input_->has_focus()) {
        std::string piece;
        for (const char* c = e.text.text; *c; ++c) {
            if (!is_separator(*c)) {
                piece += *c;
                continue;
            }
            if (!piece.empty()) input_->insert_text(piece);
            piece.clear();
            commit_input();
        }
        if (!piece.empty()) input_->insert_text(piece);
        return true;
    }
    bool handled = false;
    for (const auto& c : chips_) {
        if (c->handle_event(e)) {
            handled = true;
            break;
        }
    }
    flush_pending_removal();
    if (handled) return true;
    return input_->handle_event(e);
}

void TagInput::render(SDL_Renderer* r) const {
    if (!visible_) return;
    for (const auto& c : chips_) c->render(r);
    input_->render(r);
    if (filtered_.empty()) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    SDL_Rect list = suggestion_rect(0);
    list.h = static_cast<int>(filtered_.size()) * kSuggestionHeight;
    wk_draw::fill_rect(r, list, tm.color("background"), alpha);
    wk_draw::draw_rect(r, list, tm.color("border"), alpha);
    const LabelStyle st = Styles::Label();
    for (size_t i = 0; i < filtered_.size(); ++i) {
        SDL_Rect row = suggestion_rect(static_cast<int>(i));
        if (static_cast<int>(i) == highlighted_) wk_draw::fill_rect(r, row, tm.color("surface"), alpha);
        row.x += 8;
        row.w -= 16;
        wk_text::draw_in_rect(r, st, filtered_[i], row, wk_text::Align::Left, alpha);
    }
}

CompactTagInput::CompactTagInput() : TagInput("Tags...", {}, 5) {}

ColoredTagInput::ColoredTagInput(const std::map<std::string, SDL_Color>& colors) : colors_(colors) {}

void ColoredTagInput::set_tag_color(const std::string& tag, SDL_Color c) {
    colors_[tag] = c;
    if (TagChip* ch = chip(tag)) ch->set_color(c);
}

bool ColoredTagInput::tag_color(const std::string& tag, SDL_Color& out) const {
    auto it = colors_.find(tag);
    if (it == colors_.end()) return false;
    out = it->second;
    return true;
}

void ColoredTagInput::on_chip_created(TagChip& chip) {
    SDL_Color c;
    if (tag_color(chip.text(), c)) chip.set_color(c);
}

TagDisplay::TagDisplay(const std::vector<std::string>& tags) {
    set_tags(tags);
}

void TagDisplay::set_tags(const std::vector<std::string>& tags) {
    tags_ = tags;
    chips_.clear();
    for (const std::string& t : tags_) {
        auto c = std::make_unique<TagChip>(t, false);
        c->set_on_clicked([this, t]() {
            if (on_tag_clicked_) on_tag_clicked_(t);
        });
        chips_.push_back(std::move(c));
    }
    layout();
}

std::vector<Widget*> TagDisplay::chip_widgets() const {
    std::vector<Widget*> out;
    for (const auto& c : chips_) out.push_back(c.get());
    return out;
}

int TagDisplay::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    int w = 0;
    for (const auto& c : chips_) w += c->preferred_width() + TagInput::kChipGap;
    return std::max(0, w - TagInput::kChipGap);
}

int TagDisplay::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return wk::flow_layout(chip_widgets(), SDL_Rect{ 0, 0, w, 0 }, TagInput::kChipGap, false);
}

void TagDisplay::layout() {
    wk::flow_layout(chip_widgets(), rect_, TagInput::kChipGap);
}

bool TagDisplay::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    for (const auto& c : chips_) {
        if (c->handle_event(e)) return true;
    }
    return false;
}

void TagDisplay::render(SDL_Renderer* r) const {
    if (!visible_) return;
    for (const auto& c : chips_) c->render(r);
}
