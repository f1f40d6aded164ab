#include "profile_header.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/image_cache.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"
#include "user/user_avatar.hpp"

namespace {
constexpr int kPadX = 24;
constexpr int kAvatarGap = 16;
constexpr int kAvatarBorder = 4;
constexpr int kNameSize = 20;
constexpr int kStatValueSize = 16;
constexpr int kHeaderWidth = 640;

std::string action_name_for(const std::string& text) {
    std::string out = wk_text::to_lower(wk_text::trim(text));
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}
}

ProfileHeader::ProfileHeader(const std::string& name, const std::string& title, const std::string& avatar_path,
                             const std::string& bio, const std::string& location)
    : avatar_(std::make_unique<UserAvatar>(name, avatar_path, kAvatarSize)),
      info_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 12)) {
    avatar_->set_parent(this);
    avatar_->set_clickable(true);
    avatar_->set_on_clicked([this]() {
        if (on_avatar_clicked_) on_avatar_clicked_();
    });
    info_->set_parent(this);

    auto top = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    top->set_alignment(BoxLayout::Align::Start);
    auto names = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2);
    name_label_ = names->add_widget(std::make_unique<Label>("", "heading", "text"));
    name_label_->set_bold(true);
    name_label_->set_font_size(kNameSize);
    title_label_ = names->add_widget(std::make_unique<Label>("", "default", "text_secondary"));
    location_label_ = names->add_widget(std::make_unique<Label>("", "caption", "text_secondary"));
    top->add_widget(std::move(names), 1);
    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    edit_button_ = actions->add_widget(
        std::make_unique<BaseButton>("Edit Profile", ButtonVariant::Secondary, ButtonSize::Medium));
    edit_button_->set_on_clicked([this]() {
        if (on_edit_clicked_) on_edit_clicked_();
    });
    edit_button_->hide();
    actions_box_ = top->add_widget(std::move(actions));
    top_row_ = info_->add_widget(std::move(top));

    bio_label_ = info_->add_widget(std::make_unique<Label>("", "default", "text"));
    bio_label_->set_word_wrap(true);

    auto stats = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 24);
    stats_row_ = info_->add_widget(std::move(stats));
    stats_row_->hide();

    apply_metrics();
    set_name(name);
    set_title(title);
    set_bio(bio);
    set_location(location);
}

ProfileHeader::~ProfileHeader() = default;

void ProfileHeader::apply_metrics() {
    const int a = avatar_size();
    avatar_->set_avatar_size(a);
    info_->set_margins(kPadX, 8, kPadX, 16);
    top_row_->set_margins(a + kAvatarGap, 0, 0, 0);
    layout();
}

void ProfileHeader::set_name(const std::string& name) {
    name_ = name;
    name_label_->set_text(name);
    avatar_->set_name(name);
}

void ProfileHeader::set_title(const std::string& title) {
    title_ = title;
    title_label_->set_text(title);
    title_label_->set_visible(!title.empty());
    layout();
}

void ProfileHeader::set_bio(const std::string& bio) {
    bio_ = bio;
    bio_label_->set_text(bio);
    bio_label_->set_visible(!bio.empty());
    layout();
}

void ProfileHeader::set_location(const std::string& location) {
    location_ = location;
    location_label_->set_text(location.empty() ? std::string() : "📍 " + location);
    location_label_->set_visible(!location.empty());
    layout();
}

void ProfileHeader::set_avatar(const std::string& path) { avatar_->set_image(path); }

void ProfileHeader::set_compact(bool compact) {
    compact_ = compact;
    apply_metrics();
}

void ProfileHeader::add_stat(const std::string& label, const std::string& value) {
    for (auto& s : stats_) {
        if (s.first == label) {
            s.second->set_text(value);
            layout();
            return;
        }
    }
    auto box = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2);
    box->set_alignment(BoxLayout::Align::Center);
    auto* value_label = box->add_widget(std::make_unique<Label>(value, "heading", "text"));
    value_label->set_bold(true);
    value_label->set_font_size(kStatValueSize);
    value_label->set_alignment(wk_text::Align::Center);
    auto* name_label = box->add_widget(std::make_unique<Label>(label, "caption", "text_secondary"));
    name_label->set_alignment(wk_text::Align::Center);
    stats_row_->add_widget(std::move(box));
    stats_.emplace_back(label, value_label);
    stats_row_->show();
    layout();
}

std::string ProfileHeader::stat(const std::string& label) const {
    for (const auto& s : stats_) {
        if (s.first == label) return s.second->text();
    }
    return {};
}

std::vector<std::pair<std::string, std::string>> ProfileHeader::stats() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& s : stats_) out.emplace_back(s.first, s.second->text());
    return out;
}

BaseButton* ProfileHeader::add_action(const std::string& text, const std::string& action_name,
                                      ButtonVariant variant) {
    const std::string id = action_name.empty() ? action_name_for(text) : action_name;
    auto* button = actions_box_->add_widget(std::make_unique<BaseButton>(text, variant, ButtonSize::Medium));
    button->set_on_clicked([this, id]() {
        if (on_action_clicked_) on_action_clicked_(id);
    });
    actions_.emplace_back(button, id);
    layout();
    return button;
}

bool ProfileHeader::remove_action(const std::string& action_name) {
    auto it = std::find_if(actions_.begin(), actions_.end(),
                           [&action_name](const std::pair<BaseButton*, std::string>& a) { return a.second == action_name; });
    if (it == actions_.end()) return false;
    actions_box_->remove(it->first);
    actions_.erase(it);
    layout();
    return true;
}

BaseButton* ProfileHeader::action_button(const std::string& action_name) const {
    for (const auto& a : actions_) {
        if (a.second == action_name) return a.first;
    }
    return nullptr;
}

void ProfileHeader::set_editable(bool editable) {
    editable_ = editable;
    edit_button_->set_visible(editable);
    layout();
}

SDL_Rect ProfileHeader::banner_rect() const { return SDL_Rect{ rect_.x, rect_.y, rect_.w, banner_height() }; }

SDL_Rect ProfileHeader::avatar_rect() const {
    const int a = avatar_size();
    return SDL_Rect{ rect_.x + kPadX, rect_.y + banner_height() - a / 2, a, a };
}

int ProfileHeader::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kHeaderWidth, info_->preferred_width());
}

int ProfileHeader::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int a = avatar_size();
    // The top row has to clear the lower half of the avatar.
    return banner_height() + std::max(info_->height_for_width(w), a / 2 + 16);
}

void ProfileHeader::layout() {
    const int bh = banner_height();
    avatar_->set_rect(avatar_rect());
    info_->set_rect(SDL_Rect{ rect_.x, rect_.y + bh, rect_.w, std::max(0, rect_.h - bh) });
}

bool ProfileHeader::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (avatar_->handle_event(e)) return true;
    if (info_->handle_event(e)) return true;
    switch (banner_click_.feed(e, banner_rect())) {
    case ClickTracker::Result::Clicked:
        if (on_banner_clicked_) on_banner_clicked_();
        return true;
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::None:
    default:
        return false;
    }
}

void ProfileHeader::update() {
    avatar_->update();
    info_->update();
}

void ProfileHeader::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);

    const SDL_Rect banner = banner_rect();
    SDL_Texture* tex = banner_path_.empty() ? nullptr : ImageCache::instance().texture(r, banner_path_);
    if (tex) {
        SDL_SetTextureAlphaMod(tex, static_cast<Uint8>(alpha * 255.0f));
        SDL_RenderCopy(r, tex, nullptr, &banner);
    } else {
        const SDL_Color from = tm.color("primary");
        const SDL_Color to = tm.color("secondary");
        const int span = std::max(1, banner.w - 1);
        for (int i = 0; i < banner.w; ++i) {
            const SDL_Color c = wk::mix(from, to, static_cast<float>(i) / span);
            wk_draw::fill_rect(r, SDL_Rect{ banner.x + i, banner.y, 1, banner.h }, c, alpha);
        }
    }

    const SDL_Rect av = avatar_rect();
    const SDL_Rect ring = wk_draw::inset(av, -kAvatarBorder, -kAvatarBorder);
    wk_draw::fill_circle(r, ring.x + ring.w / 2, ring.y + ring.h / 2, ring.w / 2, tm.color("surface"), alpha);
    info_->render(r);
    avatar_->render(r);
}
