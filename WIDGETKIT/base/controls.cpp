#include "controls.hpp"

#include <algorithm>
#include <cmath>

#include "core/clock.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/overlay_manager.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kBoxTopPadding = 5;
constexpr int kBoxBottomPadding = 5;
constexpr int kLabelControlGap = 5;
constexpr int kTextboxHorizontalPadding = 6;
constexpr int kTextboxVerticalPadding = 6;
constexpr int kDropdownControlHeight = 32;
constexpr int kCheckboxTextGap = 6;
constexpr Uint32 kCaretBlinkMs = 500;
constexpr float kDisabledAlpha = 0.5f;

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) { out.push_back(s.substr(start)); break; }
        out.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

// Index of the line holding byte `pos` and the byte where that line starts.
std::pair<size_t, size_t> line_of(const std::string& s, size_t pos) {
    size_t line = 0;
    size_t line_start = 0;
    for (size_t i = 0; i < pos && i < s.size(); ++i) {
        if (s[i] == '\n') { ++line; line_start = i + 1; }
    }
    return { line, line_start };
}

size_t caret_in_line(const LabelStyle& st, const std::string& line, int x) {
    size_t pos = 0;
    while (pos < line.size()) {
        const size_t next = wk_text::utf8_next(line, pos);
        const int before = wk_text::width(st, line.substr(0, pos));
        const int after = wk_text::width(st, line.substr(0, next));
        if (x < (before + after) / 2) return pos;
        pos = next;
    }
    return line.size();
}
}

Label::Label(const std::string& text, const std::string& font_role, const std::string& color_role)
    : text_(text), font_role_(font_role), color_role_(color_role) {}

LabelStyle Label::style() const {
    LabelStyle st = Styles::Label(font_role_, color_role_);
    if (has_color_) st.color = color_;
    if (bold_) st.bold = true;
    if (font_size_ > 0) st.font_size = font_size_;
    return st;
}

int Label::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    int w = 0;
    for (const auto& line : split_lines(text_)) w = std::max(w, wk_text::width(style(), line));
    return w;
}

int Label::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const LabelStyle st = style();
    if (wrap_) return wk_text::wrapped_height(st, text_, std::max(1, w));
    return wk_text::line_height(st) * static_cast<int>(split_lines(text_).size());
}

void Label::render(SDL_Renderer* r) const {
    if (!visible_ || text_.empty()) return;
    const LabelStyle st = style();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int lh = wk_text::line_height(st);
    std::vector<std::string> lines = wrap_ ? wk_text::wrap_lines(st, text_, std::max(1, rect_.w)) : split_lines(text_);
    const int total = lh * static_cast<int>(lines.size());
    int y = rect_.y + std::max(0, (rect_.h - total) / 2);
    for (const auto& line : lines) {
        SDL_Rect row{ rect_.x, y, rect_.w, lh };
        if (elide_ || wrap_) {
            wk_text::draw_in_rect(r, st, line, row, align_, alpha);
        } else {
            const int tw = wk_text::width(st, line);
            int x = rect_.x;
            if (align_ == wk_text::Align::Center) x = rect_.x + (rect_.w - tw) / 2;
            else if (align_ == wk_text::Align::Right) x = rect_.x + rect_.w - tw;
            wk_text::draw(r, st, line, x, y, alpha);
        }
        y += lh;
    }
}

IconGlyph::IconGlyph(const std::string& name, int size, const std::string& color_role)
    : name_(name), size_(size), color_role_(color_role) {}

int IconGlyph::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : size_;
}

int IconGlyph::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : size_;
}

void IconGlyph::render(SDL_Renderer* r) const {
    if (!visible_ || name_.empty()) return;
    const SDL_Color c = has_color_ ? color_ : ThemeManager::instance().color(color_role_);
    const SDL_Rect area = wk_draw::centered(rect_, size_, size_);
    wk_icons::draw(r, name_, area, c, effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha));
}

int Separator::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return vertical_ ? 1 : 0;
}

int Separator::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return vertical_ ? 0 : 9;
}

void Separator::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const SDL_Color c = Styles::Border();
    if (vertical_) {
        const int x = rect_.x + rect_.w / 2;
        wk_draw::draw_line(r, x, rect_.y, x, rect_.y + rect_.h - 1, c, 1, effective_opacity());
    } else {
        const int y = rect_.y + rect_.h / 2;
        wk_draw::draw_line(r, rect_.x, y, rect_.x + rect_.w - 1, y, c, 1, effective_opacity());
    }
}

SDL_Color StatusDot::color() const {
    return has_color_ ? color_ : ThemeManager::instance().color(color_role_);
}

void StatusDot::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const int radius = diameter_ / 2;
    wk_draw::fill_circle(r, rect_.x + rect_.w / 2, rect_.y + rect_.h / 2, radius, color(), effective_opacity());
}

TextBox::TextBox(const std::string& text, const std::string& placeholder, bool multiline)
    : text_(text), placeholder_(placeholder), multiline_(multiline), caret_(text.size()) {}

void TextBox::set_text(const std::string& t) {
    std::string v = t;
    if (!multiline_) v.erase(std::remove(v.begin(), v.end(), '\n'), v.end());
    if (max_length_ > 0 && wk_text::utf8_length(v) > max_length_) v = wk_text::utf8_prefix(v, max_length_);
    replace_text(v, v.size());
}

void TextBox::replace_text(std::string t, size_t caret) {
    const bool changed = t != text_;
    text_ = std::move(t);
    caret_ = std::min(caret, text_.size());
    if (changed && on_text_changed_) on_text_changed_(text_);
}

void TextBox::insert_text(const std::string& s) {
    std::string ins = s;
    if (!multiline_) ins.erase(std::remove(ins.begin(), ins.end(), '\n'), ins.end());
    if (max_length_ > 0) {
        const size_t have = wk_text::utf8_length(text_);
        if (have >= max_length_) return;
        ins = wk_text::utf8_prefix(ins, max_length_ - have);
    }
    if (ins.empty()) return;
    std::string t = text_;
    t.insert(caret_, ins);
    replace_text(std::move(t), caret_ + ins.size());
}

void TextBox::set_max_length(size_t n) {
    max_length_ = n;
    if (max_length_ > 0 && wk_text::utf8_length(text_) > max_length_) {
        replace_text(wk_text::utf8_prefix(text_, max_length_), caret_);
    }
}

void TextBox::set_caret(size_t byte_pos) {
    caret_ = std::min(byte_pos, text_.size());
}

void TextBox::set_focus(bool f) {
    if (f == focused_) return;
    if (f && (!enabled_ || !visible_)) return;
    focused_ = f;
    if (focused_) SDL_StartTextInput(); else SDL_StopTextInput();
    if (on_focus_changed_) on_focus_changed_(focused_);
}

void TextBox::set_enabled(bool e) {
    Widget::set_enabled(e);
    if (!e) set_focus(false);
}

void TextBox::set_visible(bool v) {
    Widget::set_visible(v);
    if (!v) set_focus(false);
}

int TextBox::label_height(int width) const {
    if (label_.empty()) return 0;
    return wk_text::wrapped_height(Styles::Label("default", "text_secondary"), label_, std::max(1, width));
}

int TextBox::box_height() const {
    if (!multiline_) return TextBox::height();
    const int lh = wk_text::line_height(Styles::TextBox().label);
    return std::max(TextBox::height(), rows_ * lh + 2 * kTextboxVerticalPadding);
}

void TextBox::layout() {
    const int label_h = label_height(rect_.w);
    int y = rect_.y + (label_h > 0 ? kBoxTopPadding + label_h + kLabelControlGap : 0);
    int bottom = rect_.y + rect_.h - (label_h > 0 ? kBoxBottomPadding : 0);
    box_rect_ = SDL_Rect{ rect_.x, y, rect_.w, std::max(0, bottom - y) };
}

int TextBox::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : 160;
}

int TextBox::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int label_h = label_height(w);
    if (label_h == 0) return box_height();
    return kBoxTopPadding + label_h + kLabelControlGap + box_height() + kBoxBottomPadding;
}

SDL_Rect TextBox::inner_rect() const {
    if (multiline_) {
        return wk_draw::inset(box_rect_, kTextboxHorizontalPadding, kTextboxVerticalPadding);
    }
    return wk_draw::inset(box_rect_, kTextboxHorizontalPadding, 0);
}

std::string TextBox::display_text() const {
    if (!password_) return text_;
    return std::string(wk_text::utf8_length(text_), '*');
}

size_t TextBox::caret_from_point(SDL_Point p) const {
    const LabelStyle st = Styles::TextBox().label;
    const SDL_Rect inner = inner_rect();
    if (password_) {
        const size_t n = caret_in_line(st, display_text(), p.x - inner.x);
        return wk_text::utf8_prefix(text_, n).size();
    }
    if (!multiline_) {
        const int caret_x = wk_text::width(st, text_.substr(0, caret_));
        const int offset = std::max(0, caret_x - inner.w);
        return caret_in_line(st, text_, p.x - inner.x + offset);
    }
    const int lh = std::max(1, wk_text::line_height(st));
    const auto lines = split_lines(text_);
    const int caret_line = static_cast<int>(line_of(text_, caret_).first);
    const int visible_rows = std::max(1, inner.h / lh);
    const int first = std::max(0, caret_line - visible_rows + 1);
    int line = first + (p.y - inner.y) / lh;
    line = std::max(0, std::min(static_cast<int>(lines.size()) - 1, line));
    size_t start = 0;
    for (int i = 0; i < line; ++i) start += lines[static_cast<size_t>(i)].size() + 1;
    return start + caret_in_line(st, lines[static_cast<size_t>(line)], p.x - inner.x);
}

void TextBox::move_caret_vertically(int delta) {
    const auto lines = split_lines(text_);
    const auto pos = line_of(text_, caret_);
    const int target = static_cast<int>(pos.first) + delta;
    if (target < 0 || target >= static_cast<int>(lines.size())) return;
    const size_t column = wk_text::utf8_length(text_.substr(pos.second, caret_ - pos.second));
    size_t start = 0;
    for (int i = 0; i < target; ++i) start += lines[static_cast<size_t>(i)].size() + 1;
    caret_ = start + wk_text::utf8_prefix(lines[static_cast<size_t>(target)], column).size();
}

bool TextBox::handle_key(const SDL_Event& e) {
    const SDL_Keycode key = e.key.keysym.sym;
    const bool ctrl = (e.key.keysym.mod & KMOD_CTRL) != 0;
    switch (key) {
    case SDLK_LEFT:
        caret_ = wk_text::utf8_prev(text_, caret_);
        return true;
    case SDLK_RIGHT:
        caret_ = wk_text::utf8_next(text_, caret_);
        return true;
    case SDLK_HOME:
        caret_ = multiline_ ? line_of(text_, caret_).second : 0;
        return true;
    case SDLK_END:
        if (multiline_) {
            const size_t nl = text_.find('\n', caret_);
            caret_ = nl == std::string::npos ? text_.size() : nl;
        } else {
            caret_ = text_.size();
        }
        return true;
    case SDLK_UP:
    case SDLK_DOWN:
        if (!multiline_) return false;
        move_caret_vertically(key == SDLK_UP ? -1 : 1);
        return true;
    case SDLK_BACKSPACE:
        if (!read_only_ && caret_ > 0) {
            const size_t prev = wk_text::utf8_prev(text_, caret_);
            std::string t = text_;
            t.erase(prev, caret_ - prev);
            replace_text(std::move(t), prev);
        }
        return true;
    case SDLK_DELETE:
        if (!read_only_ && caret_ < text_.size()) {
            const size_t next = wk_text::utf8_next(text_, caret_);
            std::string t = text_;
            t.erase(caret_, next - caret_);
            replace_text(std::move(t), caret_);
        }
        return true;
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        if (multiline_ && !ctrl) {
            if (!read_only_) insert_text("\n");
            return true;
        }
        if (on_submitted_) on_submitted_(text_);
        return true;
    case SDLK_ESCAPE:
        if (on_escape_) {
            on_escape_();
            return true;
        }
        return false;
    case SDLK_v:
        if (ctrl && !read_only_ && SDL_HasClipboardText()) {
            char* clip = SDL_GetClipboardText();
            if (clip) {
                insert_text(clip);
                SDL_free(clip);
            }
            return true;
        }
        return false;
    case SDLK_c:
        if (ctrl && !password_) {
            if (SDL_SetClipboardText(text_.c_str()) != 0) {
                SDL_Log("Clipboard copy failed: %s", SDL_GetError());
            }
            return true;
        }
        return false;
    default:
        return false;
    }
}

bool TextBox::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e, box_rect_);
    if (wk::is_left_press(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        if (wk::point_in(box_rect_, p)) {
            set_focus(true);
            caret_ = caret_from_point(p);
            return true;
        }
        set_focus(false);
        return false;
    }
    if (!focused_) return false;
    if (e.type == SDL_TEXTINPUT) {
        if (!read_only_) insert_text(e.text.text);
        return true;
    }
    if (e.type == SDL_KEYDOWN) {
        if (key_filter_ && key_filter_(e)) return true;
        return handle_key(e);
    }
    return false;
}

void TextBox::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const TextBoxStyle st = Styles::TextBox();
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = tm.border_radius("sm");

    if (!label_.empty()) {
        wk_text::draw_wrapped(r, Styles::Label("default", "text_secondary"), label_, rect_.x, rect_.y + kBoxTopPadding,
                              std::max(1, rect_.w), 0, alpha);
    }

    const SDL_Color bg = read_only_ ? tm.color("surface") : st.bg;
    wk_draw::fill_rounded_rect(r, box_rect_, radius, bg, alpha);
    SDL_Color border = focused_ ? st.border_focus : (hovered_ ? wk::mix(st.border, st.border_focus, 0.5f) : st.border);
    wk_draw::draw_rounded_rect(r, box_rect_, radius, border, alpha);

    const SDL_Rect inner = inner_rect();
    LabelStyle text_style = st.label;
    text_style.color = st.text;
    LabelStyle placeholder_style = st.label;
    placeholder_style.color = st.placeholder;
    const int lh = wk_text::line_height(text_style);
    const bool caret_on = focused_ && ((wk::Clock::now() / kCaretBlinkMs) % 2 == 0);
    const std::string shown = display_text();
    size_t shown_caret = caret_;
    if (password_) shown_caret = wk_text::utf8_length(text_.substr(0, caret_));

    wk_draw::ClipScope clip(r, inner);
    if (!multiline_) {
        const int caret_x = wk_text::width(text_style, shown.substr(0, shown_caret));
        const int offset = std::max(0, caret_x - inner.w + 2);
        const int y = inner.y + (inner.h - lh) / 2;
        if (text_.empty()) {
            wk_text::draw(r, placeholder_style, placeholder_, inner.x, y, alpha);
        } else {
            wk_text::draw(r, text_style, shown, inner.x - offset, y, alpha);
        }
        if (caret_on) {
            const int x = inner.x - offset + caret_x;
            wk_draw::draw_line(r, x, y + 2, x, y + lh - 2, st.text, 1, alpha);
        }
        return;
    }

    const auto lines = split_lines(shown);
    const auto caret_pos = line_of(shown, shown_caret);
    const int visible_rows = std::max(1, inner.h / std::max(1, lh));
    const int first = std::max(0, static_cast<int>(caret_pos.first) - visible_rows + 1);
    if (text_.empty()) {
        wk_text::draw_wrapped(r, placeholder_style, placeholder_, inner.x, inner.y, inner.w, 0, alpha);
    }
    int y = inner.y;
    for (size_t i = static_cast<size_t>(first); i < lines.size() && y < inner.y + inner.h; ++i) {
        wk_text::draw(r, text_style, lines[i], inner.x, y, alpha);
        if (caret_on && i == caret_pos.first) {
            const int x = inner.x + wk_text::width(text_style, shown.substr(caret_pos.second, shown_caret - caret_pos.second));
            wk_draw::draw_line(r, x, y + 2, x, y + lh - 2, st.text, 1, alpha);
        }
        y += lh;
    }
    if (caret_on && lines.empty()) {
        wk_draw::draw_line(r, inner.x, inner.y + 2, inner.x, inner.y + lh - 2, st.text, 1, alpha);
    }
}

Checkbox::Checkbox(const std::string& label, bool checked)
    : label_(label), state_(checked ? CheckState::Checked : CheckState::Unchecked) {}

void Checkbox::set_state(CheckState s) {
    if (s == state_) return;
    const bool was_checked = is_checked();
    state_ = s;
    if (on_state_changed_) on_state_changed_(state_);
    if (on_toggled_ && was_checked != is_checked()) on_toggled_(is_checked());
}

void Checkbox::toggle() {
    if (user_tristate_) {
        switch (state_) {
        case CheckState::Unchecked: set_state(CheckState::Partial); break;
        case CheckState::Partial: set_state(CheckState::Checked); break;
        case CheckState::Checked: set_state(CheckState::Unchecked); break;
        }
        return;
    }
    set_state(state_ == CheckState::Checked ? CheckState::Unchecked : CheckState::Checked);
}

int Checkbox::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    if (label_.empty()) return kBoxSize;
    return kBoxSize + kCheckboxTextGap + wk_text::width(Styles::Checkbox().label, label_);
}

int Checkbox::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : Checkbox::height();
}

bool Checkbox::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
        return true;
    case ClickTracker::Result::Clicked:
        toggle();
        return true;
    case ClickTracker::Result::Released:
        return true;
    default:
        return false;
    }
}

void Checkbox::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const CheckboxStyle st = Styles::Checkbox();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    SDL_Rect box{ rect_.x, rect_.y + (rect_.h - kBoxSize) / 2, kBoxSize, kBoxSize };
    const int radius = 3;
    if (state_ == CheckState::Unchecked) {
        wk_draw::fill_rounded_rect(r, box, radius, st.box_bg, alpha);
        wk_draw::draw_rounded_rect(r, box, radius, hovered_ ? st.check : st.border, alpha);
    } else {
        wk_draw::fill_rounded_rect(r, box, radius, st.check, alpha);
        const SDL_Color mark = wk::rgba(255, 255, 255);
        if (state_ == CheckState::Checked) {
            wk_draw::draw_check(r, wk_draw::inset(box, 3, 4), mark, alpha);
        } else {
            wk_draw::draw_line(r, box.x + 4, box.y + box.h / 2, box.x + box.w - 5, box.y + box.h / 2, mark, 2, alpha);
        }
    }
    if (!label_.empty()) {
        SDL_Rect text_rect{ box.x + box.w + kCheckboxTextGap, rect_.y,
                            std::max(0, rect_.w - box.w - kCheckboxTextGap), rect_.h };
        wk_text::draw_in_rect(r, st.label, label_, text_rect, wk_text::Align::Left, alpha);
    }
}

Dropdown::Dropdown(const std::vector<std::string>& options, int idx, const std::string& label)
    : label_(label), options_(options), list_(std::make_unique<DropdownList>(*this)) {
    if (!options_.empty()) index_ = std::max(0, std::min(static_cast<int>(options_.size()) - 1, idx));
    list_->set_parent(this);
    list_->hide();
}

Dropdown::~Dropdown() {
    close_list();
}

void Dropdown::set_options(const std::vector<std::string>& options) {
    close_list();
    options_ = options;
    if (options_.empty()) index_ = -1;
    else index_ = std::max(0, std::min(static_cast<int>(options_.size()) - 1, index_));
}

void Dropdown::add_option(const std::string& o) {
    options_.push_back(o);
    if (index_ < 0) index_ = 0;
}

std::string Dropdown::selected_text() const {
    if (index_ < 0 || index_ >= static_cast<int>(options_.size())) return {};
    return options_[static_cast<size_t>(index_)];
}

void Dropdown::set_selected(int idx) {
    if (idx < 0 || idx >= static_cast<int>(options_.size()) || idx == index_) return;
    index_ = idx;
    if (on_changed_) on_changed_(index_, options_[static_cast<size_t>(index_)]);
}

bool Dropdown::set_selected_text(const std::string& text) {
    auto it = std::find(options_.begin(), options_.end(), text);
    if (it == options_.end()) return false;
    set_selected(static_cast<int>(it - options_.begin()));
    return true;
}

void Dropdown::choose(int idx) {
    close_list();
    set_selected(idx);
}

void Dropdown::open_list() {
    if (expanded_ || options_.empty() || !enabled_) return;
    OverlayManager& overlays = OverlayManager::instance();
    const int rows = std::min(static_cast<int>(options_.size()), kMaxVisibleItems);
    SDL_Rect area{ box_rect_.x, box_rect_.y + box_rect_.h + 2, box_rect_.w, rows * kItemHeight + 2 };
    const SDL_Rect screen = overlays.screen_rect();
    if (area.y + area.h > screen.h && box_rect_.y - area.h - 2 >= 0) {
        area.y = box_rect_.y - area.h - 2;
    }
    list_->set_rect(overlays.clamp_to_screen(area));
    list_->set_highlighted(index_);
    list_->show();
    expanded_ = true;
    overlays.open(list_.get(), OverlayManager::Mode::LightDismiss, [this]() { close_list(); });
}

void Dropdown::close_list() {
    if (!list_) return;
    expanded_ = false;
    list_->hide();
    OverlayManager::instance().close(list_.get());
}

void Dropdown::set_visible(bool v) {
    Widget::set_visible(v);
    if (!v) close_list();
}

int Dropdown::label_height() const {
    if (label_.empty()) return 0;
    return wk_text::line_height(Styles::Label("default", "text_secondary"));
}

void Dropdown::layout() {
    const int label_h = label_height();
    int y = rect_.y + (label_h > 0 ? kBoxTopPadding + label_h + kLabelControlGap : 0);
    const int bottom = rect_.y + rect_.h - (label_h > 0 ? kBoxBottomPadding : 0);
    box_rect_ = SDL_Rect{ rect_.x, y, rect_.w, std::max(kDropdownControlHeight, bottom - y) };
}

int Dropdown::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle st = Styles::TextBox().label;
    int w = 0;
    for (const auto& o : options_) w = std::max(w, wk_text::width(st, o));
    return std::max(120, w + 2 * kTextboxHorizontalPadding + 20);
}

int Dropdown::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int label_h = label_height();
    if (label_h == 0) return kDropdownControlHeight;
    return kBoxTopPadding + label_h + kLabelControlGap + kDropdownControlHeight + kBoxBottomPadding;
}

bool Dropdown::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e, box_rect_);
    if (wk::is_left_press(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        if (wk::point_in(box_rect_, p)) {
            if (expanded_) close_list(); else open_list();
            return true;
        }
    }
    return false;
}

void Dropdown::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const TextBoxStyle st = Styles::TextBox();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = ThemeManager::instance().border_radius("sm");
    if (!label_.empty()) {
        wk_text::draw(r, Styles::Label("default", "text_secondary"), label_, rect_.x, rect_.y + kBoxTopPadding, alpha);
    }
    wk_draw::fill_rounded_rect(r, box_rect_, radius, st.bg, alpha);
    const SDL_Color border = (hovered_ || expanded_) ? st.border_focus : st.border;
    wk_draw::draw_rounded_rect(r, box_rect_, radius, border, alpha);
    LabelStyle value_style = st.label;
    value_style.color = st.text;
    std::string shown = selected_text();
    if (shown.empty()) {
        shown = placeholder_;
        value_style.color = st.placeholder;
    }
    const int arrow_w = 16;
    SDL_Rect text_rect{ box_rect_.x + kTextboxHorizontalPadding, box_rect_.y,
                        std::max(0, box_rect_.w - 2 * kTextboxHorizontalPadding - arrow_w), box_rect_.h };
    wk_text::draw_in_rect(r, value_style, shown, text_rect, wk_text::Align::Left, alpha);
    SDL_Rect arrow{ box_rect_.x + box_rect_.w - arrow_w - kTextboxHorizontalPadding, box_rect_.y, arrow_w, box_rect_.h };
    wk_draw::draw_chevron(r, wk_draw::centered(arrow, 10, 10),
                          expanded_ ? wk_draw::Direction::Up : wk_draw::Direction::Down, st.placeholder, alpha);
}

DropdownList::~DropdownList() {
    OverlayManager::instance().close(this);
}

int DropdownList::visible_count() const {
    return std::min(static_cast<int>(owner_.options_.size()), Dropdown::kMaxVisibleItems);
}

void DropdownList::set_highlighted(int idx) {
    const int n = static_cast<int>(owner_.options_.size());
    if (n == 0) { highlighted_ = -1; first_ = 0; return; }
    highlighted_ = std::max(0, std::min(n - 1, idx));
    if (highlighted_ < first_) first_ = highlighted_;
    if (highlighted_ >= first_ + visible_count()) first_ = highlighted_ - visible_count() + 1;
}

SDL_Rect DropdownList::item_rect(int idx) const {
    return SDL_Rect{ rect_.x + 1, rect_.y + 1 + (idx - first_) * Dropdown::kItemHeight, rect_.w - 2,
                     Dropdown::kItemHeight };
}

int DropdownList::index_at(SDL_Point p) const {
    if (!wk::point_in(rect_, p)) return -1;
    const int idx = first_ + (p.y - rect_.y - 1) / Dropdown::kItemHeight;
    if (idx < 0 || idx >= static_cast<int>(owner_.options_.size())) return -1;
    return idx;
}

bool DropdownList::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    const int n = static_cast<int>(owner_.options_.size());
    if (e.type == SDL_MOUSEMOTION) {
        const int idx = index_at(SDL_Point{ e.motion.x, e.motion.y });
        if (idx >= 0) highlighted_ = idx;
        return idx >= 0;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        const int max_first = std::max(0, n - visible_count());
        first_ = std::max(0, std::min(max_first, first_ - e.wheel.y));
        return true;
    }
    if (wk::is_left_press(e)) {
        const int idx = index_at(SDL_Point{ e.button.x, e.button.y });
        if (idx >= 0) {
            owner_.choose(idx);
            return true;
        }
        return false;
    }
    if (e.type == SDL_KEYDOWN) {
        switch (e.key.keysym.sym) {
        case SDLK_UP:
            set_highlighted(highlighted_ - 1);
            return true;
        case SDLK_DOWN:
            set_highlighted(highlighted_ + 1);
            return true;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            if (highlighted_ >= 0) owner_.choose(highlighted_);
            return true;
        default:
            break;
        }
    }
    return false;
}

void DropdownList::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const TextBoxStyle st = Styles::TextBox();
    const ThemeManager& tm = ThemeManager::instance();
    const int radius = tm.border_radius("sm");
    wk_draw::draw_shadow(r, rect_, radius, 4, wk::rgba(0, 0, 0, 40));
    wk_draw::fill_rounded_rect(r, rect_, radius, st.bg);
    wk_draw::draw_rounded_rect(r, rect_, radius, st.border);
    LabelStyle item_style = st.label;
    item_style.color = st.text;
    wk_draw::ClipScope clip(r, rect_);
    const int n = static_cast<int>(owner_.options_.size());
    for (int i = first_; i < n && i < first_ + visible_count(); ++i) {
        const SDL_Rect row = item_rect(i);
        if (i == highlighted_) {
            wk_draw::fill_rect(r, row, tm.color("hover"));
        }
        if (i == owner_.index_) {
            wk_draw::fill_rect(r, SDL_Rect{ row.x, row.y, 3, row.h }, tm.color("primary"));
        }
        SDL_Rect text_rect{ row.x + kTextboxHorizontalPadding, row.y, row.w - 2 * kTextboxHorizontalPadding, row.h };
        wk_text::draw_in_rect(r, item_style, owner_.options_[static_cast<size_t>(i)], text_rect);
    }
}

ProgressBar::ProgressBar(int value) {
    set_value(value);
}

void ProgressBar::set_value(int v) {
    value_ = std::max(0, std::min(100, v));
}

int ProgressBar::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : 160;
}

int ProgressBar::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return show_text_ ? 20 : 8;
}

void ProgressBar::update() {
    if (!indeterminate_) return;
    phase_ = static_cast<float>(wk::Clock::now() % 1500) / 1500.0f;
}

void ProgressBar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = std::min(rect_.h / 2, tm.border_radius("sm"));
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("border"), alpha);
    const SDL_Color fill = tm.color(color_role_);
    if (indeterminate_) {
        const int seg = std::max(8, rect_.w * 3 / 10);
        const int x = rect_.x - seg + static_cast<int>(phase_ * (rect_.w + seg));
        wk_draw::ClipScope clip(r, rect_);
        wk_draw::fill_rounded_rect(r, SDL_Rect{ x, rect_.y, seg, rect_.h }, radius, fill, alpha);
        return;
    }
    const int w = rect_.w * value_ / 100;
    if (w > 0) wk_draw::fill_rounded_rect(r, SDL_Rect{ rect_.x, rect_.y, w, rect_.h }, radius, fill, alpha);
    if (show_text_) {
        LabelStyle st = Styles::Label("caption", "text");
        wk_text::draw_in_rect(r, st, std::to_string(value_) + "%", rect_, wk_text::Align::Center, alpha);
    }
}
