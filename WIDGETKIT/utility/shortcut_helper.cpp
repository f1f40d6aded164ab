#include "shortcut_helper.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRowHeight = 32;
constexpr int kRowPadX = 10;
constexpr int kPanelWidth = 460;
constexpr int kPanelHeight = 480;
constexpr int kClearSize = 24;
constexpr int kExportKeyWidth = 20;

struct NamedKey {
    const char* name;
    SDL_Keycode key;
};

const NamedKey kNamedKeys[] = {
    { "esc", SDLK_ESCAPE },     { "escape", SDLK_ESCAPE },    { "enter", SDLK_RETURN },
    { "return", SDLK_RETURN },  { "tab", SDLK_TAB },          { "space", SDLK_SPACE },
    { "backspace", SDLK_BACKSPACE }, { "del", SDLK_DELETE },  { "delete", SDLK_DELETE },
    { "ins", SDLK_INSERT },     { "insert", SDLK_INSERT },    { "home", SDLK_HOME },
    { "end", SDLK_END },        { "pgup", SDLK_PAGEUP },      { "pageup", SDLK_PAGEUP },
    { "pgdown", SDLK_PAGEDOWN }, { "pagedown", SDLK_PAGEDOWN }, { "left", SDLK_LEFT },
    { "right", SDLK_RIGHT },    { "up", SDLK_UP },            { "down", SDLK_DOWN },
};

std::vector<std::string> split_plus(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find('+', start);
        if (pos == std::string::npos) {
            out.push_back(wk_text::trim(s.substr(start)));
            return out;
        }
        out.push_back(wk_text::trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
}

bool parse_modifier(const std::string& token, Uint16& mods) {
    const std::string t = wk_text::to_lower(token);
    if (t == "ctrl" || t == "control") mods |= KMOD_CTRL;
    else if (t == "shift") mods |= KMOD_SHIFT;
    else if (t == "alt" || t == "option") mods |= KMOD_ALT;
    else if (t == "meta" || t == "cmd" || t == "command" || t == "super" || t == "win") mods |= KMOD_GUI;
    else return false;
    return true;
}

SDL_Keycode parse_key(const std::string& token) {
    const std::string t = wk_text::to_lower(token);
    if (t.size() == 1) {
        const unsigned char c = static_cast<unsigned char>(t[0]);
        if (c > 32 && c < 127) return static_cast<SDL_Keycode>(c);
    }
    for (const auto& named : kNamedKeys) {
        if (t == named.name) return named.key;
    }
    if (t.size() >= 2 && t[0] == 'f' && std::all_of(t.begin() + 1, t.end(), [](unsigned char c) { return std::isdigit(c); })) {
        const int n = std::stoi(t.substr(1));
        if (n >= 1 && n <= 12) return SDLK_F1 + (n - 1);
    }
    return SDL_GetKeyFromName(token.c_str());
}
}

namespace wk_keys {

bool parse(const std::string& text, KeySequence& out) {
    const std::string s = wk_text::trim(text);
    if (s.empty()) return false;
    std::string key_token;
    std::vector<std::string> modifiers;
    if (s == "+") {
        key_token = "+";
    } else if (s.size() >= 2 && s.compare(s.size() - 2, 2, "++") == 0) {
        key_token = "+";
        modifiers = split_plus(s.substr(0, s.size() - 2));
    } else {
        modifiers = split_plus(s);
        key_token = modifiers.back();
        modifiers.pop_back();
    }
    KeySequence seq;
    for (const auto& m : modifiers) {
        if (m.empty() || !parse_modifier(m, seq.mods)) return false;
    }
    if (key_token.empty()) return false;
    seq.key = parse_key(key_token);
    if (!seq.valid()) return false;
    out = seq;
    return true;
}

KeySequence from_event(const SDL_Event& e) {
    KeySequence seq;
    if (e.type != SDL_KEYDOWN && e.type != SDL_KEYUP) return seq;
    seq.key = e.key.keysym.sym;
    const Uint16 mod = e.key.keysym.mod;
    if (mod & KMOD_CTRL) seq.mods |= KMOD_CTRL;
    if (mod & KMOD_SHIFT) seq.mods |= KMOD_SHIFT;
    if (mod & KMOD_ALT) seq.mods |= KMOD_ALT;
    if (mod & KMOD_GUI) seq.mods |= KMOD_GUI;
    switch (seq.key) {
    case SDLK_KP_PLUS:
        seq.key = SDLK_PLUS;
        break;
    case SDLK_KP_MINUS:
        seq.key = SDLK_MINUS;
        break;
    case SDLK_KP_ENTER:
        seq.key = SDLK_RETURN;
        break;
    case SDLK_EQUALS:
        // Shift+= types '+' on most layouts.
        if (seq.mods & KMOD_SHIFT) seq.key = SDLK_PLUS;
        break;
    default:
        break;
    }
    if (seq.key == SDLK_PLUS) seq.mods &= static_cast<Uint16>(~KMOD_SHIFT);
    return seq;
}

std::string to_string(const KeySequence& seq) {
    std::string out;
    if (seq.mods & KMOD_CTRL) out += "Ctrl+";
    if (seq.mods & KMOD_SHIFT) out += "Shift+";
    if (seq.mods & KMOD_ALT) out += "Alt+";
    if (seq.mods & KMOD_GUI) out += "Meta+";
    if (seq.key > 32 && seq.key < 127) {
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(seq.key)));
        return out;
    }
    const char* name = SDL_GetKeyName(seq.key);
    out += (name && *name) ? name : "Unknown";
    return out;
}

bool is_modifier_key(SDL_Keycode key) {
    switch (key) {
    case SDLK_LCTRL:
    case SDLK_RCTRL:
    case SDLK_LSHIFT:
    case SDLK_RSHIFT:
    case SDLK_LALT:
    case SDLK_RALT:
    case SDLK_LGUI:
    case SDLK_RGUI:
    case SDLK_MODE:
        return true;
    default:
        return false;
    }
}

}

ShortcutRow::ShortcutRow(const std::string& name, const std::string& sequence, const std::string& description)
    : name_(name), sequence_(sequence), description_(description) {}

int ShortcutRow::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle st = Styles::Label("default", "text");
    return wk_text::width(st, name_) + wk_text::width(st, sequence_) + wk_text::width(st, description_) + 6 * kRowPadX;
}

int ShortcutRow::height_for_width(int) const { return fixed_h_ >= 0 ? fixed_h_ : kRowHeight; }

bool ShortcutRow::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Clicked:
        if (click_.clicks() >= 2 && on_activated_) {
            // Activation may rebuild the list this row lives in.
            auto cb = on_activated_;
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

void ShortcutRow::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    if (click_.pressed()) wk_draw::fill_rect(r, rect_, wk::with_alpha(tm.color("primary"), 40), alpha);
    else if (hovered_) wk_draw::fill_rect(r, rect_, tm.color("hover"), alpha);
    wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);

    const int name_w = rect_.w * 3 / 10;
    const int key_w = rect_.w / 4;
    LabelStyle name_style = Styles::Label("default", "text");
    name_style.bold = true;
    const SDL_Rect name_rect{ rect_.x + kRowPadX, rect_.y, std::max(0, name_w - kRowPadX), rect_.h };
    wk_text::draw_in_rect(r, name_style, wk_text::elide(name_style, name_, name_rect.w), name_rect,
                          wk_text::Align::Left, alpha);

    const LabelStyle key_style = Styles::Label("caption", "text");
    const int chip_w = std::min(key_w - 8, wk_text::width(key_style, sequence_) + 12);
    const int chip_h = wk_text::line_height(key_style) + 4;
    const SDL_Rect chip{ rect_.x + name_w, rect_.y + (rect_.h - chip_h) / 2, std::max(0, chip_w), chip_h };
    wk_draw::fill_rounded_rect(r, chip, 3, tm.color("light"), alpha);
    wk_draw::draw_rounded_rect(r, chip, 3, tm.color("border"), alpha);
    wk_text::draw_in_rect(r, key_style, sequence_, chip, wk_text::Align::Center, alpha);

    const LabelStyle desc_style = Styles::Label("default", "text_secondary");
    const SDL_Rect desc_rect{ rect_.x + name_w + key_w, rect_.y, std::max(0, rect_.w - name_w - key_w - kRowPadX),
                              rect_.h };
    wk_text::draw_in_rect(r, desc_style, wk_text::elide(desc_style, description_, desc_rect.w), desc_rect,
                          wk_text::Align::Left, alpha);
}

ShortcutHelper::ShortcutHelper(bool load_defaults)
    : search_timer_(true), layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
    layout_->set_margins(8);

    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_alignment(BoxLayout::Align::Center);
    auto* title = header->add_widget(std::make_unique<Label>("Keyboard Shortcuts", "heading", "text"));
    title->set_bold(true);
    header->add_stretch();
    quick_help_button_ = header->add_widget(
        std::make_unique<BaseButton>("Quick Help", ButtonVariant::Primary, ButtonSize::Small));
    quick_help_button_->set_checkable(true);
    quick_help_button_->set_on_toggled([this](bool on) { set_quick_help(on); });
    layout_->add_widget(std::move(header));

    auto search_row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    search_row->set_alignment(BoxLayout::Align::Center);
    search_ = search_row->add_widget(std::make_unique<TextBox>("", "Search shortcuts..."), 1);
    search_->set_on_text_changed([this](const std::string& text) {
        if (text != filter_) search_timer_.start(kSearchDebounceMs);
    });
    clear_button_ = search_row->add_widget(std::make_unique<IconButton>("close", kClearSize));
    clear_button_->set_tooltip("Clear search");
    clear_button_->set_on_clicked([this]() { clear_search(); });
    layout_->add_widget(std::move(search_row));

    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    list_ = list.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(list)), 1);

    auto quick = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8);
    quick->set_margins(12);
    auto* quick_title = quick->add_widget(std::make_unique<Label>("Quick Help Mode", "heading", "primary"));
    quick_title->set_bold(true);
    auto* instructions = quick->add_widget(std::make_unique<Label>(
        "Press any key combination to see if it has a shortcut assigned.\nPress Escape to exit quick help mode.",
        "default", "text"));
    instructions->set_word_wrap(true);
    key_label_ = quick->add_widget(std::make_unique<Label>("Press a key combination...", "default", "primary"));
    key_label_->set_bold(true);
    info_label_ = quick->add_widget(std::make_unique<Label>("", "default", "text"));
    info_label_->set_word_wrap(true);
    quick_panel_ = layout_->add_widget(std::move(quick), 1);
    quick_panel_->hide();

    search_timer_.set_on_timeout([this]() { set_filter(search_->text()); });

    if (load_defaults) load_default_shortcuts();
    else rebuild();
}

ShortcutHelper::~ShortcutHelper() = default;

void ShortcutHelper::load_default_shortcuts() {
    add_shortcut("new_file", "Ctrl+N", "Create new file", "File");
    add_shortcut("open_file", "Ctrl+O", "Open file", "File");
    add_shortcut("save_file", "Ctrl+S", "Save file", "File");
    add_shortcut("save_as", "Ctrl+Shift+S", "Save file as", "File");
    add_shortcut("close_file", "Ctrl+W", "Close file", "File");
    add_shortcut("quit", "Ctrl+Q", "Quit application", "File");

    add_shortcut("undo", "Ctrl+Z", "Undo last action", "Edit");
    add_shortcut("redo", "Ctrl+Y", "Redo last action", "Edit");
    add_shortcut("cut", "Ctrl+X", "Cut selection", "Edit");
    add_shortcut("copy", "Ctrl+C", "Copy selection", "Edit");
    add_shortcut("paste", "Ctrl+V", "Paste from clipboard", "Edit");
    add_shortcut("select_all", "Ctrl+A", "Select all", "Edit");
    add_shortcut("find", "Ctrl+F", "Find text", "Edit");
    add_shortcut("replace", "Ctrl+H", "Find and replace", "Edit");

    add_shortcut("zoom_in", "Ctrl++", "Zoom in", "View");
    add_shortcut("zoom_out", "Ctrl+-", "Zoom out", "View");
    add_shortcut("zoom_reset", "Ctrl+0", "Reset zoom", "View");
    add_shortcut("fullscreen", "F11", "Toggle fullscreen", "View");

    add_shortcut("go_back", "Alt+Left", "Go back", "Navigation");
    add_shortcut("go_forward", "Alt+Right", "Go forward", "Navigation");
    add_shortcut("refresh", "F5", "Refresh/Reload", "Navigation");

    add_shortcut("help", "F1", "Show help", "Help");
    add_shortcut("shortcuts", "Ctrl+/", "Show shortcuts", "Help");
}

ShortcutHelper::Shortcut* ShortcutHelper::find(const std::string& name) {
    for (auto& s : shortcuts_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const ShortcutHelper::Shortcut* ShortcutHelper::get_shortcut(const std::string& name) const {
    for (const auto& s : shortcuts_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

bool ShortcutHelper::add_shortcut(const std::string& name, const std::string& key_sequence,
                                  const std::string& description, const std::string& category,
                                  std::function<void()> callback) {
    KeySequence keys;
    if (name.empty() || !wk_keys::parse(key_sequence, keys)) {
        std::cerr << "[ShortcutHelper] Invalid key sequence for " << name << ": " << key_sequence << "\n";
        return false;
    }
    const std::string cat = category.empty() ? "General" : category;
    remove_shortcut(name);
    if (std::find(categories_.begin(), categories_.end(), cat) == categories_.end()) categories_.push_back(cat);
    shortcuts_.push_back(Shortcut{ name, wk_text::trim(key_sequence), description, cat, keys, std::move(callback) });
    rebuild();
    return true;
}

bool ShortcutHelper::remove_shortcut(const std::string& name) {
    auto it = std::find_if(shortcuts_.begin(), shortcuts_.end(), [&name](const Shortcut& s) { return s.name == name; });
    if (it == shortcuts_.end()) return false;
    const std::string cat = it->category;
    shortcuts_.erase(it);
    const bool used = std::any_of(shortcuts_.begin(), shortcuts_.end(), [&cat](const Shortcut& s) { return s.category == cat; });
    if (!used) categories_.erase(std::remove(categories_.begin(), categories_.end(), cat), categories_.end());
    rebuild();
    return true;
}

bool ShortcutHelper::bind(const std::string& name, std::function<void()> callback) {
    Shortcut* s = find(name);
    if (!s) return false;
    s->callback = std::move(callback);
    return true;
}

std::vector<const ShortcutHelper::Shortcut*> ShortcutHelper::find_matching(const KeySequence& keys) const {
    std::vector<const Shortcut*> out;
    if (!keys.valid()) return out;
    for (const auto& s : shortcuts_) {
        if (s.keys == keys) out.push_back(&s);
    }
    return out;
}

bool ShortcutHelper::activate(const std::string& name) {
    const Shortcut* s = get_shortcut(name);
    if (!s) return false;
    const std::string activated = s->name;
    const std::function<void()> cb = s->callback;
    if (cb) cb();
    if (on_shortcut_activated_) on_shortcut_activated_(activated);
    return true;
}

bool ShortcutHelper::matches_filter(const Shortcut& s) const {
    const std::string q = wk_text::to_lower(wk_text::trim(filter_));
    if (q.empty()) return true;
    return wk_text::to_lower(s.name).find(q) != std::string::npos ||
           wk_text::to_lower(s.sequence).find(q) != std::string::npos ||
           wk_text::to_lower(s.description).find(q) != std::string::npos;
}

void ShortcutHelper::set_filter(const std::string& query) {
    filter_ = query;
    search_timer_.stop();
    if (search_->text() != query) search_->set_text(query);
    rebuild();
    scroll_->scroll_to_top();
}

void ShortcutHelper::clear_search() { set_filter(std::string()); }

std::vector<std::string> ShortcutHelper::visible_shortcuts() const {
    std::vector<std::string> out;
    for (const auto& cat : categories_) {
        for (const auto& s : shortcuts_) {
            if (s.category == cat && matches_filter(s)) out.push_back(s.name);
        }
    }
    return out;
}

void ShortcutHelper::rebuild() {
    list_->clear();
    bool any = false;
    for (const auto& cat : categories_) {
        bool header_added = false;
        for (const auto& s : shortcuts_) {
            if (s.category != cat || !matches_filter(s)) continue;
            if (!header_added) {
                auto caption = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
                caption->set_margins(kRowPadX, 10, kRowPadX, 4);
                auto* label = caption->add_widget(std::make_unique<Label>(cat, "heading", "text"));
                label->set_bold(true);
                list_->add(std::move(caption));
                header_added = true;
            }
            auto* row = list_->add_widget(std::make_unique<ShortcutRow>(s.name, s.sequence, s.description));
            const std::string name = s.name;
            row->set_on_activated([this, name]() { activate(name); });
            any = true;
        }
    }
    if (!any) {
        auto empty = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
        empty->set_margins(kRowPadX, 16, kRowPadX, 16);
        auto* label = empty->add_widget(std::make_unique<Label>(
            shortcuts_.empty() ? "No shortcuts registered" : "No shortcuts found", "default", "text_secondary"));
        label->set_alignment(wk_text::Align::Center);
        list_->add(std::move(empty));
    }
    layout();
}

void ShortcutHelper::set_quick_help(bool on) {
    quick_help_ = on;
    quick_help_button_->set_checked(on);
    scroll_->set_visible(!on);
    quick_panel_->set_visible(on);
    if (on) {
        search_->set_focus(false);
        key_label_->set_text("Press a key combination...");
        info_label_->set_text("");
    }
    layout();
}

const std::string& ShortcutHelper::quick_help_key() const { return key_label_->text(); }

const std::string& ShortcutHelper::quick_help_info() const { return info_label_->text(); }

void ShortcutHelper::describe_keys(const KeySequence& keys) {
    key_label_->set_text("Key: " + wk_keys::to_string(keys));
    const auto matches = find_matching(keys);
    if (matches.empty()) {
        info_label_->set_text("No shortcut assigned to this key combination.");
    } else {
        std::string info = "Found shortcuts:";
        for (const auto* s : matches) info += "\n\xE2\x80\xA2 " + s->name + ": " + s->description + " (" + s->category + ")";
        info_label_->set_text(info);
    }
    layout();
}

std::string ShortcutHelper::export_shortcuts() const {
    std::string out = "Keyboard Shortcuts\n";
    out += std::string(50, '=') + "\n\n";
    for (const auto& cat : categories_) {
        out += cat + ":\n";
        out += std::string(cat.size(), '-') + "\n";
        for (const auto& s : shortcuts_) {
            if (s.category != cat) continue;
            std::string key = s.sequence;
            if (key.size() < kExportKeyWidth) key.append(kExportKeyWidth - key.size(), ' ');
            out += "  " + key + " " + s.description + "\n";
        }
        out += "\n";
    }
    return out;
}

int ShortcutHelper::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kPanelWidth, layout_->preferred_width());
}

int ShortcutHelper::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kPanelHeight;
}

void ShortcutHelper::layout() { layout_->set_rect(rect_); }

bool ShortcutHelper::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (quick_help_) {
        if (e.type == SDL_TEXTINPUT) return true;
        if (e.type == SDL_KEYDOWN) {
            const KeySequence keys = wk_keys::from_event(e);
            if (wk_keys::is_modifier_key(keys.key)) return true;
            if (keys.key == SDLK_ESCAPE && keys.mods == KMOD_NONE) set_quick_help(false);
            else describe_keys(keys);
            return true;
        }
        return layout_->handle_event(e);
    }
    if (layout_->handle_event(e)) return true;
    if (e.type != SDL_KEYDOWN) return false;
    const KeySequence keys = wk_keys::from_event(e);
    // Plain typing into the search box is not a shortcut.
    const bool typing = search_->has_focus() && (keys.mods & (KMOD_CTRL | KMOD_ALT | KMOD_GUI)) == 0 &&
                        keys.key > 31 && keys.key < 127;
    if (typing) return false;
    const auto matches = find_matching(keys);
    if (matches.empty()) return false;
    return activate(matches.front()->name);
}

void ShortcutHelper::update() {
    search_timer_.poll();
    layout_->update();
}

void ShortcutHelper::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::draw_rect(r, rect_, tm.color("border"), alpha);
    if (quick_help_) {
        const SDL_Rect panel = quick_panel_->rect();
        wk_draw::fill_rounded_rect(r, panel, 6, tm.color("background"), alpha);
        wk_draw::draw_rounded_rect(r, panel, 6, tm.color("primary"), alpha);
        wk_draw::draw_rounded_rect(r, wk_draw::inset(panel, 1, 1), 5, tm.color("primary"), alpha);
    }
    layout_->render(r);
}

ShortcutCapture::ShortcutCapture() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8)) {
    layout_->set_parent(this);
    layout_->set_alignment(BoxLayout::Align::Center);
    prompt_ = layout_->add_widget(std::make_unique<Label>("Press keys to capture shortcut...", "default", "text"), 1);
    button_ = layout_->add_widget(std::make_unique<BaseButton>("Capture", ButtonVariant::Secondary, ButtonSize::Small));
    button_->set_on_clicked([this]() {
        if (capturing_) stop_capture();
        else start_capture();
    });
}

ShortcutCapture::~ShortcutCapture() = default;

void ShortcutCapture::start_capture() {
    capturing_ = true;
    prompt_->set_text("Press key combination...");
    button_->set_text("Cancel");
    layout();
}

void ShortcutCapture::stop_capture() {
    capturing_ = false;
    prompt_->set_text(captured_.empty() ? "Press keys to capture shortcut..." : "Captured: " + captured_);
    button_->set_text("Capture");
    layout();
}

const std::string& ShortcutCapture::prompt_text() const { return prompt_->text(); }

int ShortcutCapture::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int ShortcutCapture::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void ShortcutCapture::layout() { layout_->set_rect(rect_); }

bool ShortcutCapture::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (capturing_ && e.type == SDL_KEYDOWN) {
        const KeySequence keys = wk_keys::from_event(e);
        if (wk_keys::is_modifier_key(keys.key)) return true;
        if (keys.key == SDLK_ESCAPE && keys.mods == KMOD_NONE) {
            stop_capture();
            return true;
        }
        captured_ = wk_keys::to_string(keys);
        stop_capture();
        if (on_shortcut_captured_) on_shortcut_captured_(captured_);
        return true;
    }
    if (capturing_ && e.type == SDL_TEXTINPUT) return true;
    return layout_->handle_event(e);
}

void ShortcutCapture::render(SDL_Renderer* r) const {
    if (!visible_) return;
    if (capturing_) {
        const auto& tm = ThemeManager::instance();
        wk_draw::draw_rounded_rect(r, rect_, 4, tm.color("primary"), effective_opacity());
    }
    layout_->render(r);
}
