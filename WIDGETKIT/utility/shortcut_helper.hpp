#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class IconButton;
class Label;
class ScrollArea;
class TextBox;

// A key plus the exact set of modifiers that must be held with it.
struct KeySequence {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // combination of KMOD_CTRL, KMOD_SHIFT, KMOD_ALT, KMOD_GUI

    bool valid() const { return key != SDLK_UNKNOWN; }
    bool operator==(const KeySequence& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const KeySequence& o) const { return !(*this == o); }
};

namespace wk_keys {
// "Ctrl+Shift+K", "Alt+Left", "F11", "Ctrl++". Modifier and key names are
// case-insensitive; Cmd, Super and Win are aliases of Meta.
bool parse(const std::string& text, KeySequence& out);
// Key and modifiers of a key-down event, with left/right modifiers folded.
KeySequence from_event(const SDL_Event& e);
// Canonical text, e.g. "Ctrl+Shift+K".
std::string to_string(const KeySequence& seq);
// Ctrl, Shift, Alt and Meta on their own.
bool is_modifier_key(SDL_Keycode key);
}

// One row of the shortcut list: name, key chip and description. Double
// click activates the shortcut.
class ShortcutRow : public Widget {
public:
    ShortcutRow(const std::string& name, const std::string& sequence, const std::string& description);

    const std::string& name() const { return name_; }
    void set_on_activated(std::function<void()> cb) { on_activated_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    std::string name_;
    std::string sequence_;
    std::string description_;
    ClickTracker click_;
    std::function<void()> on_activated_{};
};

// Registry and viewer of keyboard shortcuts grouped by category. Key events
// that reach handle_event() run the matching shortcut. In quick help mode
// key presses are only looked up and described; Escape leaves the mode.
class ShortcutHelper : public Widget {
public:
    static constexpr Uint32 kSearchDebounceMs = 300;

    struct Shortcut {
        std::string name;
        std::string sequence;
        std::string description;
        std::string category;
        KeySequence keys;
        std::function<void()> callback;
    };

    explicit ShortcutHelper(bool load_defaults = true);
    ~ShortcutHelper() override;

    // Re-adding a name replaces it. Returns false for an empty name or a
    // sequence that does not parse.
    bool add_shortcut(const std::string& name, const std::string& key_sequence, const std::string& description,
                      const std::string& category = "General", std::function<void()> callback = {});
    // Empty categories disappear.
    bool remove_shortcut(const std::string& name);
    bool bind(const std::string& name, std::function<void()> callback);
    const Shortcut* get_shortcut(const std::string& name) const;
    const std::vector<Shortcut>& get_shortcuts() const { return shortcuts_; }
    // In the order they first appeared.
    const std::vector<std::string>& categories() const { return categories_; }
    // File, Edit, View, Navigation and Help basics.
    void load_default_shortcuts();

    // Shortcuts bound to the key combination of the event.
    std::vector<const Shortcut*> find_matching(const KeySequence& keys) const;
    // Runs the callback and emits shortcut_activated.
    bool activate(const std::string& name);

    // Case-insensitive match on name, sequence or description. Typing in
    // the search box applies it after a short pause.
    void set_filter(const std::string& query);
    const std::string& filter_text() const { return filter_; }
    // Names listed under the current filter, grouped by category.
    std::vector<std::string> visible_shortcuts() const;
    void clear_search();

    void set_quick_help(bool on);
    bool quick_help() const { return quick_help_; }
    const std::string& quick_help_key() const;
    const std::string& quick_help_info() const;

    std::string export_shortcuts() const;

    TextBox* search_box() const { return search_; }
    BaseButton* quick_help_button() const { return quick_help_button_; }

    void set_on_shortcut_activated(std::function<void(const std::string&)> cb) {
        on_shortcut_activated_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    Shortcut* find(const std::string& name);
    bool matches_filter(const Shortcut& s) const;
    void rebuild();
    void describe_keys(const KeySequence& keys);

    std::vector<Shortcut> shortcuts_;
    std::vector<std::string> categories_;
    std::string filter_;
    bool quick_help_ = false;
    Timer search_timer_;
    std::unique_ptr<BoxLayout> layout_;
    BaseButton* quick_help_button_ = nullptr;
    TextBox* search_ = nullptr;
    IconButton* clear_button_ = nullptr;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* list_ = nullptr;
    BoxLayout* quick_panel_ = nullptr;
    Label* key_label_ = nullptr;
    Label* info_label_ = nullptr;
    std::function<void(const std::string&)> on_shortcut_activated_{};
};

// Records the next key combination pressed while capturing. Escape cancels.
class ShortcutCapture : public Widget {
public:
    ShortcutCapture();
    ~ShortcutCapture() override;

    void start_capture();
    void stop_capture();
    bool is_capturing() const { return capturing_; }
    const std::string& captured() const { return captured_; }
    const std::string& prompt_text() const;
    BaseButton* capture_button() const { return button_; }

    void set_on_shortcut_captured(std::function<void(const std::string&)> cb) {
        on_shortcut_captured_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    bool capturing_ = false;
    std::string captured_;
    std::unique_ptr<BoxLayout> layout_;
    Label* prompt_ = nullptr;
    BaseButton* button_ = nullptr;
    std::function<void(const std::string&)> on_shortcut_captured_{};
};
