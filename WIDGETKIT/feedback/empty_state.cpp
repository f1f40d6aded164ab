#include "empty_state.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "feedback/progress_overlay.hpp"

namespace {
constexpr int kMargin = 32;
constexpr int kSpacing = 16;
constexpr int kMaxTextWidth = 400;

std::string singular(std::string s) {
    while (!s.empty() && s.back() == 's') s.pop_back();
    return s;
}
}

EmptyState::EmptyState(const std::string& icon, const std::string& title, const std::string& description,
                       const std::string& action_text)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, kSpacing)) {
    layout_->set_parent(this);
    layout_->set_margins(kMargin);
    layout_->set_alignment(BoxLayout::Align::Center);
    layout_->add_stretch();

    icon_ = layout_->add_widget(std::make_unique<IconGlyph>(icon, kIconSize, "text_secondary"));
    icon_->set_visible(!icon.empty());

    auto t = std::make_unique<Label>(title, "heading");
    t->set_alignment(wk_text::Align::Center);
    t->set_word_wrap(true);
    title_ = layout_->add_widget(std::move(t));
    title_->set_visible(!title.empty());

    auto d = std::make_unique<Label>(description, "default", "text_secondary");
    d->set_alignment(wk_text::Align::Center);
    d->set_word_wrap(true);
    description_ = layout_->add_widget(std::move(d));
    description_->set_visible(!description.empty());

    action_row_ = layout_->add_widget(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12));
    action_row_->hide();
    layout_->add_stretch();

    if (!action_text.empty()) add_action(action_text);
}

void EmptyState::set_icon(const std::string& icon) {
    icon_->set_icon(icon);
    icon_->set_visible(!icon.empty());
}

const std::string& EmptyState::icon() const {
    return icon_->icon();
}

void EmptyState::set_title(const std::string& t) {
    title_->set_text(t);
    title_->set_visible(!t.empty());
    layout();
}

const std::string& EmptyState::title() const {
    return title_->text();
}

void EmptyState::set_description(const std::string& d) {
    description_->set_text(d);
    description_->set_visible(!d.empty());
    layout();
}

const std::string& EmptyState::description() const {
    return description_->text();
}

BaseButton* EmptyState::add_action(const std::string& text, const std::string& name, ButtonVariant variant) {
    const std::string key = name.empty() ? text : name;
    remove_action(key);
    auto button = std::make_unique<BaseButton>(text, variant);
    button->set_on_clicked([this, key]() { on_action(key); });
    BaseButton* raw = action_row_->add_widget(std::move(button));
    actions_.push_back(Action{ key, raw });
    action_row_->show();
    layout();
    return raw;
}

bool EmptyState::remove_action(const std::string& name) {
    auto it = std::find_if(actions_.begin(), actions_.end(), [&](const Action& a) { return a.name == name; });
    if (it == actions_.end()) return false;
    action_row_->remove(it->button);
    actions_.erase(it);
    action_row_->set_visible(!actions_.empty());
    layout();
    return true;
}

void EmptyState::clear_actions() {
    action_row_->clear();
    actions_.clear();
    action_row_->hide();
    layout();
}

BaseButton* EmptyState::action(const std::string& name) const {
    for (const Action& a : actions_) {
        if (a.name == name) return a.button;
    }
    return nullptr;
}

bool EmptyState::trigger_action(const std::string& name) {
    BaseButton* b = action(name);
    if (!b) return false;
    b->click();
    return true;
}

void EmptyState::on_action(const std::string& name) {
    if (on_action_clicked_) on_action_clicked_(name);
}

int EmptyState::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::min(kMaxTextWidth + 2 * kMargin, layout_->preferred_width());
}

int EmptyState::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void EmptyState::layout() {
    layout_->set_rect(rect_);
}

bool EmptyState::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void EmptyState::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}

NoDataEmptyState::NoDataEmptyState(const std::string& data_type)
    : EmptyState("folder", "No " + data_type + " found", "There are no " + data_type + " to display right now.") {
    add_action("Add " + singular(data_type), "add_item", ButtonVariant::Primary);
}

NoSearchResultsEmptyState::NoSearchResultsEmptyState(const std::string& query) : EmptyState("search") {
    set_query(query);
    add_action("Clear search", "clear_search", ButtonVariant::Secondary);
    add_action("Browse all", "browse_all", ButtonVariant::Primary);
}

void NoSearchResultsEmptyState::set_query(const std::string& query) {
    query_ = query;
    if (query.empty()) {
        set_title("No search results");
        set_description("Enter a search term to find items.");
    } else {
        set_title("No results for '" + query + "'");
        set_description("Try adjusting your search terms or filters.");
    }
}

ErrorEmptyState::ErrorEmptyState(const std::string& message) : EmptyState("error", "Something went wrong") {
    icon_->set_color_role("danger");
    set_error(message);
    add_action("Retry", "retry", ButtonVariant::Primary);
    add_action("Report issue", "report", ButtonVariant::Secondary);
}

void ErrorEmptyState::set_error(const std::string& message) {
    set_description(message.empty() ? "We encountered an error while loading the data." : message);
}

void ErrorEmptyState::on_action(const std::string& name) {
    if (name == "retry" && on_retry_) on_retry_();
    EmptyState::on_action(name);
}

LoadingEmptyState::LoadingEmptyState()
    : EmptyState("refresh", "Loading...", "Please wait while we fetch your data.") {
    icon_->set_color_role("primary");
    auto dots = std::make_unique<DotsIndicator>();
    dots_ = dots.get();
    layout_->insert(static_cast<size_t>(layout_->index_of(action_row_)), std::move(dots));
    dots_->start();
}

PermissionEmptyState::PermissionEmptyState(const std::string& resource)
    : EmptyState("warning", "Access denied", "You don't have permission to view " + resource + ".") {
    icon_->set_color_role("warning");
    add_action("Request access", "request_access", ButtonVariant::Primary);
    add_action("Go back", "go_back", ButtonVariant::Secondary);
}

FirstTimeEmptyState::FirstTimeEmptyState(const std::string& feature)
    : EmptyState("star", "Welcome to " + feature + "!",
                 "Get started by creating your first item or exploring the " + feature + ".") {
    icon_->set_color_role("primary");
    add_action("Get started", "get_started", ButtonVariant::Primary);
    add_action("Take tour", "take_tour", ButtonVariant::Secondary);
}
