#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/layout.hpp"
#include "style/styles.hpp"

class BaseButton;
class DotsIndicator;
class IconGlyph;
class Label;

// Centred placeholder for a view with nothing to show: a large icon, a title,
// a description and a row of action buttons.
class EmptyState : public Widget {
public:
    static constexpr int kIconSize = 64;

    EmptyState(const std::string& icon = "folder", const std::string& title = "No items found",
               const std::string& description = {}, const std::string& action_text = {});

    void set_icon(const std::string& icon);
    const std::string& icon() const;
    void set_title(const std::string& t);
    const std::string& title() const;
    void set_description(const std::string& d);
    const std::string& description() const;

    // Buttons report their name (the text when no name is given) through
    // action_clicked. Adding an existing name replaces that button.
    BaseButton* add_action(const std::string& text, const std::string& name = {},
                           ButtonVariant variant = ButtonVariant::Primary);
    bool remove_action(const std::string& name);
    void clear_actions();
    size_t action_count() const { return actions_.size(); }
    BaseButton* action(const std::string& name) const;
    // Same as clicking the button.
    bool trigger_action(const std::string& name);

    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    virtual void on_action(const std::string& name);

    std::unique_ptr<BoxLayout> layout_;
    IconGlyph* icon_ = nullptr;
    Label* title_ = nullptr;
    Label* description_ = nullptr;
    BoxLayout* action_row_ = nullptr;

private:
    struct Action {
        std::string name;
        BaseButton* button;
    };

    std::vector<Action> actions_;
    std::function<void(const std::string&)> on_action_clicked_{};
};

// "No items found" with an "Add item" action (add_item).
class NoDataEmptyState : public EmptyState {
public:
    explicit NoDataEmptyState(const std::string& data_type = "items");
};

// Actions clear_search and browse_all.
class NoSearchResultsEmptyState : public EmptyState {
public:
    explicit NoSearchResultsEmptyState(const std::string& query = {});

    void set_query(const std::string& query);
    const std::string& query() const { return query_; }

private:
    std::string query_;
};

// Actions retry and report.
class ErrorEmptyState : public EmptyState {
public:
    explicit ErrorEmptyState(const std::string& message = {});

    void set_error(const std::string& message);
    void set_on_retry(std::function<void()> cb) { on_retry_ = std::move(cb); }

protected:
    void on_action(const std::string& name) override;

private:
    std::function<void()> on_retry_{};
};

// No actions; animated dots under the text.
class LoadingEmptyState : public EmptyState {
public:
    LoadingEmptyState();

    DotsIndicator* dots() const { return dots_; }

private:
    DotsIndicator* dots_ = nullptr;
};

// Actions request_access and go_back.
class PermissionEmptyState : public EmptyState {
public:
    explicit PermissionEmptyState(const std::string& resource = "this content");
};

// Actions get_started and take_tour.
class FirstTimeEmptyState : public EmptyState {
public:
    explicit FirstTimeEmptyState(const std::string& feature = "feature");
};
