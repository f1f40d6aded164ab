#include "command_palette.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRowPadX = 16;
constexpr int kIconSize = 20;
constexpr int kWheelStep = 40;

std::string to_upper(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}
}

// Scrolling list of category captions and command rows. Clicking a command
// runs it.
class CommandListView : public Widget {
public:
    explicit CommandListView(CommandPalette& palette) : palette_(palette) {}

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : 0; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : 0; }

    int row_at(SDL_Point p) const {
        if (!wk::point_in(rect_, p)) return -1;
        const int y = p.y - rect_.y + palette_.scroll_;
        for (size_t i = 0; i < palette_.rows_.size(); ++i) {
            const auto& row = palette_.rows_[i];
            if (y >= row.y && y < row.y + row.h) return row.category ? -1 : row.command;
        }
        return -1;
    }

    bool handle_event(const SDL_Event& e) override {
        if (!visible_ || !enabled_) return false;
        if (e.type == SDL_MOUSEMOTION) {
            track_hover(e);
            hovered_row_ = row_at(wk::event_point(e));
            return false;
        }
        if (e.type == SDL_MOUSEWHEEL) {
            if (!hovered_) return false;
            const int max_scroll = std::max(0, palette_.list_height() - rect_.h);
            palette_.scroll_ = std::max(0, std::min(max_scroll, palette_.scroll_ - e.wheel.y * kWheelStep));
            return true;
        }
        if (wk::is_left_press(e)) {
            pressed_row_ = row_at(wk::event_point(e));
            if (pressed_row_ < 0) return false;
            palette_.set_selected_index(pressed_row_);
            return true;
        }
        if (wk::is_left_release(e) && pressed_row_ >= 0) {
            const int row = pressed_row_;
            pressed_row_ = -1;
            if (row_at(wk::event_point(e)) == row) palette_.execute(row);
            return true;
        }
        return false;
    }

    void render(SDL_Renderer* r) const override {
        if (!visible_) return;
        const auto& tm = ThemeManager::instance();
        const float alpha = effective_opacity();
        wk_draw::ClipScope clip(r, rect_);
        wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
        if (palette_.rows_.empty()) {
            const LabelStyle st = Styles::Label("default", "text_secondary");
            wk_text::draw_in_rect(r, st, "No matching commands", wk_draw::inset(rect_, kRowPadX, 0),
                                  wk_text::Align::Center, alpha);
            return;
        }
        for (const auto& row : palette_.rows_) {
            const SDL_Rect rr{ rect_.x, rect_.y + row.y - palette_.scroll_, rect_.w, row.h };
            if (rr.y + rr.h < rect_.y || rr.y > rect_.y + rect_.h) continue;
            if (row.category) {
                wk_draw::fill_rect(r, rr, tm.color("light"), alpha);
                LabelStyle st = Styles::Label("caption", "text_secondary");
                st.bold = true;
                wk_text::draw_in_rect(r, st, to_upper(row.text), wk_draw::inset(rr, kRowPadX, 0), wk_text::Align::Left,
                                      alpha);
                wk_draw::fill_rect(r, SDL_Rect{ rr.x, rr.y + rr.h - 1, rr.w, 1 }, tm.color("border"), alpha);
                continue;
            }
            const CommandPalette::Command& cmd = *palette_.filtered_[static_cast<size_t>(row.command)];
            const bool selected = row.command == palette_.selected_;
            if (selected) {
                wk_draw::fill_rect(r, rr, tm.color("primary"), alpha);
            } else if (row.command == hovered_row_) {
                wk_draw::fill_rect(r, rr, tm.color("hover"), alpha);
            }
            wk_draw::fill_rect(r, SDL_Rect{ rr.x, rr.y + rr.h - 1, rr.w, 1 }, tm.color("border"), alpha);

            const SDL_Color fg = selected ? wk::rgba(255, 255, 255) : tm.color("text");
            const SDL_Color fg2 = selected ? wk::rgba(255, 255, 255) : tm.color("text_secondary");
            int x = rr.x + kRowPadX;
            if (!cmd.icon.empty()) {
                wk_icons::draw(r, cmd.icon, SDL_Rect{ x, rr.y + (rr.h - kIconSize) / 2, kIconSize, kIconSize }, fg,
                               alpha);
                x += kIconSize + 12;
            }
            int right = rr.x + rr.w - kRowPadX;
            if (!cmd.shortcut.empty()) {
                LabelStyle sst = Styles::Label("caption", "text_secondary");
                sst.color = fg2;
                const int w = wk_text::width(sst, cmd.shortcut) + 12;
                const int h = wk_text::line_height(sst) + 4;
                const SDL_Rect chip{ right - w, rr.y + (rr.h - h) / 2, w, h };
                if (!selected) wk_draw::fill_rounded_rect(r, chip, 3, tm.color("light"), alpha);
                wk_draw::draw_rounded_rect(r, chip, 3, selected ? fg2 : tm.color("border"), alpha);
                wk_text::draw_in_rect(r, sst, cmd.shortcut, chip, wk_text::Align::Center, alpha);
                right = chip.x - 12;
            }
            LabelStyle name_style = Styles::Label("default", "text");
            name_style.color = fg;
            name_style.bold = true;
            const int text_w = std::max(0, right - x);
            if (cmd.description.empty()) {
                wk_text::draw_in_rect(r, name_style, wk_text::elide(name_style, cmd.name, text_w),
                                      SDL_Rect{ x, rr.y, text_w, rr.h }, wk_text::Align::Left, alpha);
            } else {
                LabelStyle desc_style = Styles::Label("caption", "text_secondary");
                desc_style.color = fg2;
                const int nh = wk_text::line_height(name_style);
                const int dh = wk_text::line_height(desc_style);
                const int top = rr.y + (rr.h - nh - dh - 2) / 2;
                wk_text::draw(r, name_style, wk_text::elide(name_style, cmd.name, text_w), x, top, alpha);
                wk_text::draw(r, desc_style, wk_text::elide(desc_style, cmd.description, text_w), x, top + nh + 2,
                              alpha);
            }
        }
    }

private:
    CommandPalette& palette_;
    int hovered_row_ = -1;
    int pressed_row_ = -1;
};

CommandPalette::CommandPalette() : BasePopup(true) {
    set_fixed_size(kWidth, kHeight);
    content_->set_margins(0);
    content_->set_spacing(0);

    auto search_row = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    search_row->set_margins(16, 12, 16, 12);
    search_ = search_row->add_widget(std::make_unique<TextBox>(std::string{}, "Type a command..."));
    search_->set_on_text_changed([this](const std::string&) { query_edited(); });
    content_->add(std::move(search_row));
    content_->add(std::make_unique<Separator>());

    list_ = content_->add_widget(std::make_unique<CommandListView>(*this), 1);

    auto footer_row = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    footer_row->set_margins(16, 8, 16, 8);
    footer_ = footer_row->add_widget(std::make_unique<Label>(
        "\xE2\x86\x91\xE2\x86\x93 to navigate \xE2\x80\xA2 Enter to execute \xE2\x80\xA2 Esc to close", "caption",
        "text_secondary"));
    content_->add(std::make_unique<Separator>());
    content_->add(std::move(footer_row));

    refilter();
}

CommandPalette::~CommandPalette() = default;

void CommandPalette::add_command(const std::string& name, const std::string& description, const std::string& shortcut,
                                 const nlohmann::json& data, const std::string& category, const std::string& icon) {
    if (name.empty()) return;
    Command cmd;
    cmd.name = name;
    cmd.description = description;
    cmd.shortcut = shortcut;
    cmd.data = data.is_null() ? nlohmann::json::object() : data;
    cmd.category = category;
    cmd.icon = icon;
    cmd.search_text = wk_text::to_lower(name + " " + description + " " + category);
    auto it = std::find_if(commands_.begin(), commands_.end(), [&name](const Command& c) { return c.name == name; });
    if (it != commands_.end()) *it = cmd;
    else commands_.push_back(cmd);
    refilter();
}

bool CommandPalette::remove_command(const std::string& name) {
    auto it = std::find_if(commands_.begin(), commands_.end(), [&name](const Command& c) { return c.name == name; });
    if (it == commands_.end()) return false;
    commands_.erase(it);
    refilter();
    return true;
}

void CommandPalette::clear_commands() {
    commands_.clear();
    refilter();
}

bool CommandPalette::has_command(const std::string& name) const { return find_command(name) != nullptr; }

const CommandPalette::Command* CommandPalette::find_command(const std::string& name) const {
    for (const auto& c : commands_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

void CommandPalette::set_query(const std::string& text) {
    if (search_->text() == text) {
        refilter();
        return;
    }
    search_->set_text(text);
}

std::string CommandPalette::query() const { return search_->text(); }

std::vector<const CommandPalette::Command*> CommandPalette::match_commands(const std::string& q) const {
    std::vector<const Command*> out;
    for (const auto& c : commands_) {
        if (q.empty() || c.search_text.find(q) != std::string::npos) out.push_back(&c);
    }
    std::stable_sort(out.begin(), out.end(), [&q](const Command* a, const Command* b) {
        const std::string an = wk_text::to_lower(a->name);
        const std::string bn = wk_text::to_lower(b->name);
        const bool a_prefix = an.compare(0, q.size(), q) == 0;
        const bool b_prefix = bn.compare(0, q.size(), q) == 0;
        if (a_prefix != b_prefix) return a_prefix;
        return an < bn;
    });
    return out;
}

void CommandPalette::refilter() {
    filtered_ = match_commands(wk_text::to_lower(wk_text::trim(search_->text())));

    rows_.clear();
    std::string current_category;
    bool seen_category = false;
    int y = 0;
    for (size_t i = 0; i < filtered_.size(); ++i) {
        const Command& c = *filtered_[i];
        if (!c.category.empty() && c.category != current_category) {
            if (seen_category) {
                Row header;
                header.category = true;
                header.text = c.category;
                header.y = y;
                header.h = kCategoryHeight;
                rows_.push_back(header);
                y += header.h;
            }
            current_category = c.category;
            seen_category = true;
        }
        Row row;
        row.command = static_cast<int>(i);
        row.text = c.name;
        row.y = y;
        row.h = c.description.empty() ? kRowHeight : kRowHeightWithDescription;
        rows_.push_back(row);
        y += row.h;
    }
    scroll_ = 0;
    selected_ = filtered_.empty() ? -1 : 0;
}

int CommandPalette::list_height() const {
    return rows_.empty() ? 0 : rows_.back().y + rows_.back().h;
}

std::vector<std::string> CommandPalette::filtered_commands() const {
    std::vector<std::string> out;
    for (const auto* c : filtered_) out.push_back(c->name);
    return out;
}

void CommandPalette::set_selected_index(int index) {
    if (index < 0 || index >= static_cast<int>(filtered_.size())) return;
    selected_ = index;
    ensure_selected_visible();
}

std::string CommandPalette::selected_command() const {
    if (selected_ < 0 || selected_ >= static_cast<int>(filtered_.size())) return {};
    return filtered_[static_cast<size_t>(selected_)]->name;
}

void CommandPalette::select_next() {
    if (filtered_.empty()) return;
    const int n = static_cast<int>(filtered_.size());
    set_selected_index(selected_ < n - 1 ? selected_ + 1 : 0);
}

void CommandPalette::select_previous() {
    if (filtered_.empty()) return;
    const int n = static_cast<int>(filtered_.size());
    set_selected_index(selected_ > 0 ? selected_ - 1 : n - 1);
}

void CommandPalette::ensure_selected_visible() {
    const SDL_Rect area = list_->rect();
    for (const auto& row : rows_) {
        if (row.category || row.command != selected_) continue;
        if (row.y < scroll_) scroll_ = row.y;
        else if (row.y + row.h > scroll_ + area.h && area.h > 0) scroll_ = row.y + row.h - area.h;
        return;
    }
}

SDL_Rect CommandPalette::command_rect(int index) const {
    const SDL_Rect area = list_->rect();
    for (const auto& row : rows_) {
        if (row.category || row.command != index) continue;
        const SDL_Rect rr{ area.x, area.y + row.y - scroll_, area.w, row.h };
        return wk_draw::intersect(rr, area);
    }
    return SDL_Rect{ 0, 0, 0, 0 };
}

void CommandPalette::execute(int index) {
    if (index < 0 || index >= static_cast<int>(filtered_.size())) return;
    const std::string name = filtered_[static_cast<size_t>(index)]->name;
    const nlohmann::json data = filtered_[static_cast<size_t>(index)]->data;
    if (on_command_executed_) on_command_executed_(name, data);
    close_animated();
}

bool CommandPalette::execute_selected() {
    if (selected_ < 0) return false;
    execute(selected_);
    return true;
}

void CommandPalette::show_palette() {
    search_->clear();
    refilter();
    show_centered();
    search_->set_focus(true);
}

bool CommandPalette::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    if (e.type == SDL_KEYDOWN) {
        switch (e.key.keysym.sym) {
        case SDLK_ESCAPE:
            close_animated();
            return true;
        case SDLK_DOWN:
            select_next();
            return true;
        case SDLK_UP:
            select_previous();
            return true;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            execute_selected();
            return true;
        default:
            break;
        }
    }
    return BasePopup::handle_event(e);
}

QuickCommandPalette::QuickCommandPalette() {
    add_command("New File", "Create a new file", "Ctrl+N", { { "action", "new_file" } }, "File", "file");
    add_command("Open File", "Open an existing file", "Ctrl+O", { { "action", "open_file" } }, "File", "folder");
    add_command("Save", "Save current file", "Ctrl+S", { { "action", "save" } }, "File");
    add_command("Save As", "Save file with new name", "Ctrl+Shift+S", { { "action", "save_as" } }, "File");
    add_command("Copy", "Copy selection", "Ctrl+C", { { "action", "copy" } }, "Edit", "copy");
    add_command("Paste", "Paste from clipboard", "Ctrl+V", { { "action", "paste" } }, "Edit", "clipboard");
    add_command("Undo", "Undo last action", "Ctrl+Z", { { "action", "undo" } }, "Edit");
    add_command("Redo", "Redo last action", "Ctrl+Y", { { "action", "redo" } }, "Edit");
    add_command("Settings", "Open application settings", "Ctrl+,", { { "action", "settings" } }, "Preferences",
                "settings");
    add_command("Help", "Show help documentation", "F1", { { "action", "help" } }, "Help", "help");
}

SearchableCommandPalette::SearchableCommandPalette() {
    search_timer_.set_on_timeout([this]() { refilter(); });
}

int SearchableCommandPalette::search_score(const Command& command, const std::string& query) {
    const std::string name = wk_text::to_lower(command.name);
    const std::string description = wk_text::to_lower(command.description);
    const std::string category = wk_text::to_lower(command.category);

    int score = 0;
    if (query == name) score += 100;
    else if (name.compare(0, query.size(), query) == 0) score += 80;
    else if (name.find(query) != std::string::npos) score += 60;

    if (description.find(query) != std::string::npos) score += 30;
    if (category.find(query) != std::string::npos) score += 20;

    std::istringstream words(query);
    std::string word;
    while (words >> word) {
        if (name.find(word) != std::string::npos) score += 10;
        if (description.find(word) != std::string::npos) score += 5;
    }
    return score;
}

std::vector<const CommandPalette::Command*> SearchableCommandPalette::match_commands(const std::string& query) const {
    std::vector<const Command*> out;
    if (query.empty()) {
        for (const auto& c : commands()) out.push_back(&c);
        return out;
    }
    std::vector<std::pair<int, const Command*>> scored;
    for (const auto& c : commands()) {
        const int score = search_score(c, query);
        if (score > 0) scored.emplace_back(score, &c);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<int, const Command*>& a, const std::pair<int, const Command*>& b) {
                         return a.first > b.first;
                     });
    for (const auto& entry : scored) out.push_back(entry.second);
    return out;
}

void SearchableCommandPalette::query_edited() {
    search_timer_.start(kSearchDelay);
}

void SearchableCommandPalette::flush_search() {
    if (!search_timer_.is_active()) return;
    search_timer_.stop();
    refilter();
}

void SearchableCommandPalette::update() {
    search_timer_.poll();
    CommandPalette::update();
}
