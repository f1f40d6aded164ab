#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "core/animation.hpp"
#include "style/styles.hpp"

class ButtonGroup;

// Push button with theme variants, three sizes, an optional icon, a loading
// state and a press animation (scale to 0.95 and back, 100 ms each way).
class BaseButton : public AnimatedWidget {
public:
    explicit BaseButton(const std::string& text = {}, ButtonVariant variant = ButtonVariant::Primary,
                        ButtonSize size = ButtonSize::Medium);
    ~BaseButton() override;

    void set_text(const std::string& t) { text_ = t; }
    const std::string& text() const { return text_; }
    void set_icon(const std::string& name, bool right = false) { icon_ = name; icon_right_ = right; }
    const std::string& icon() const { return icon_; }
    void set_variant(ButtonVariant v) { variant_ = v; }
    ButtonVariant variant() const { return variant_; }
    void set_size(ButtonSize s) { size_ = s; }
    ButtonSize button_size() const { return size_; }

    // Shows "Loading..." and disables the button; turning it off restores the
    // text and enables the button again.
    void set_loading(bool loading);
    bool is_loading() const { return loading_; }

    // Checkable buttons flip their checked state on every click and report it
    // through toggled. set_checked() does not emit.
    void set_checkable(bool c) { checkable_ = c; }
    bool is_checkable() const { return checkable_; }
    void set_checked(bool c);
    bool is_checked() const { return checked_; }
    bool is_pressed() const { return click_.pressed(); }

    // Runs the click path as if the user had clicked.
    void click();

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }
    void set_on_toggled(std::function<void(bool)> cb) { on_toggled_ = std::move(cb); }

    int min_width() const;
    int min_height() const;
    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    virtual ButtonStyle current_style() const;
    virtual void on_checked_changed(bool checked) { (void)checked; }
    int corner_radius(const ButtonStyle& st, const SDL_Rect& r) const;
    void animate_click();

    std::string text_;
    std::string icon_;
    bool icon_right_ = false;
    ButtonVariant variant_;
    ButtonSize size_;
    bool loading_ = false;
    std::string text_before_loading_;
    bool checkable_ = false;
    bool checked_ = false;
    bool circular_ = false;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
    std::function<void(bool)> on_toggled_{};

private:
    friend class ButtonGroup;
    ButtonGroup* group_ = nullptr;
};

// Round ghost button that shows only an icon.
class IconButton : public BaseButton {
public:
    explicit IconButton(const std::string& icon, int diameter = 32);
    int preferred_width() const override;
    int height_for_width(int w) const override;

private:
    int diameter_;
};

// Checkable button drawn primary when checked and secondary otherwise.
class ToggleButton : public BaseButton {
public:
    explicit ToggleButton(const std::string& text = {});

protected:
    void on_checked_changed(bool checked) override;
};

// Mutually exclusive set of checkable buttons. Does not own the buttons.
class ButtonGroup {
public:
    ButtonGroup() = default;
    ~ButtonGroup();
    ButtonGroup(const ButtonGroup&) = delete;
    ButtonGroup& operator=(const ButtonGroup&) = delete;

    void add_button(BaseButton* button);
    void remove_button(BaseButton* button);
    const std::vector<BaseButton*>& buttons() const { return buttons_; }
    BaseButton* checked_button() const { return active_; }
    int checked_index() const;
    void set_checked_index(int idx);

    void set_on_button_clicked(std::function<void(int)> cb) { on_button_clicked_ = std::move(cb); }

private:
    friend class BaseButton;
    void button_clicked(BaseButton* button);

    std::vector<BaseButton*> buttons_;
    BaseButton* active_ = nullptr;
    std::function<void(int)> on_button_clicked_{};
};
