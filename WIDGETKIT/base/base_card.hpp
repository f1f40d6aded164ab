#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>

#include "core/animation.hpp"
#include "core/layout.hpp"

class Label;

// Card with optional header, body and footer sections. Header and footer stay
// hidden until something is put in them.
class BaseCard : public AnimatedWidget {
public:
    static constexpr Uint32 kHoverLiftMs = 150;
    static constexpr int kHoverLift = 2;

    BaseCard();
    ~BaseCard() override = default;

    // Replace the contents of a section and return the raw pointer.
    template <class T>
    T* set_header(std::unique_ptr<T> w) {
        T* raw = w.get();
        header_->clear();
        title_label_ = nullptr;
        header_->add(std::move(w), 1);
        header_->show();
        return raw;
    }
    template <class T>
    T* set_body(std::unique_ptr<T> w) {
        T* raw = w.get();
        body_->clear();
        body_->add(std::move(w), 1);
        return raw;
    }
    template <class T>
    T* set_footer(std::unique_ptr<T> w) {
        T* raw = w.get();
        footer_->clear();
        footer_->add(std::move(w), 1);
        footer_->show();
        return raw;
    }
    Widget* add_header_action(std::unique_ptr<Widget> w);
    Widget* add_footer_widget(std::unique_ptr<Widget> w);
    // Heading label at the start of the header; created on first use.
    void set_title(const std::string& text);
    std::string title() const;

    BoxLayout* header() const { return header_.get(); }
    BoxLayout* body() const { return body_.get(); }
    BoxLayout* footer() const { return footer_.get(); }

    void set_hoverable(bool h) { hoverable_ = h; }
    bool is_hoverable() const { return hoverable_; }
    void set_selectable(bool s);
    bool is_selectable() const { return selectable_; }
    // Ignored unless the card is selectable.
    void set_selected(bool s);
    bool is_selected() const { return selected_; }
    void set_shadow(bool s) { shadow_ = s; }

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }
    void set_on_hover_entered(std::function<void()> cb) { on_hover_entered_ = std::move(cb); }
    void set_on_hover_left(std::function<void()> cb) { on_hover_left_ = std::move(cb); }
    void set_on_selection_changed(std::function<void(bool)> cb) { on_selection_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    void on_hover_changed(bool hovered) override;
    // Runs after a click inside the card that no section consumed.
    virtual void on_card_clicked();
    // Height of the sections without the animated height limit.
    int content_height(int w) const;
    void render_frame(SDL_Renderer* r, const SDL_Rect& area) const;
    void render_sections(SDL_Renderer* r) const;

    std::unique_ptr<BoxLayout> header_;
    std::unique_ptr<BoxLayout> body_;
    std::unique_ptr<BoxLayout> footer_;
    Label* title_label_ = nullptr;
    bool hoverable_ = true;
    bool selectable_ = false;
    bool selected_ = false;
    bool shadow_ = true;
    ClickTracker click_;
    std::function<void()> on_clicked_{};
    std::function<void()> on_hover_entered_{};
    std::function<void()> on_hover_left_{};
    std::function<void(bool)> on_selection_changed_{};
};
