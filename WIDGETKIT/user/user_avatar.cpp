#include "user_avatar.hpp"

#include <cctype>
#include <sstream>

#include "core/draw_utils.hpp"
#include "core/image_cache.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
const char* const kPalette[UserAvatar::kPaletteSize] = {
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4", "#FECA57", "#FF9FF3",
    "#54A0FF", "#5F27CD", "#00D2D3", "#FF9F43", "#EE5A24", "#0984E3",
};

// FNV-1a, so the colour for a name is the same on every run.
Uint32 stable_hash(const std::string& s) {
    Uint32 h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

std::string first_glyph_upper(const std::string& word) {
    const size_t n = wk_text::utf8_next(word, 0);
    std::string g = word.substr(0, n);
    if (g.size() == 1) g[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(g[0])));
    return g;
}
}

UserAvatar::UserAvatar(const std::string& name, const std::string& image_path, int size, const std::string& status)
    : name_(name), image_path_(image_path), size_(size), status_(status) {}

std::string UserAvatar::initials_for(const std::string& name) {
    std::istringstream in(name);
    std::vector<std::string> words;
    std::string w;
    while (in >> w) words.push_back(w);
    if (words.empty()) return "?";
    if (words.size() == 1) return first_glyph_upper(words.front());
    return first_glyph_upper(words.front()) + first_glyph_upper(words.back());
}

int UserAvatar::palette_index(const std::string& name) {
    if (name.empty()) return -1;
    return static_cast<int>(stable_hash(name) % kPaletteSize);
}

SDL_Color UserAvatar::palette_color(int index) {
    if (index < 0 || index >= kPaletteSize) return ThemeManager::instance().color("primary");
    return wk::parse_hex(kPalette[index]);
}

SDL_Color UserAvatar::status_color(const std::string& status) {
    if (status == "online") return wk::parse_hex("#10B981");
    if (status == "away") return wk::parse_hex("#F59E0B");
    if (status == "busy") return wk::parse_hex("#EF4444");
    return wk::parse_hex("#6B7280");
}

SDL_Color UserAvatar::background_color() const {
    if (neutral_) return ThemeManager::instance().color("light");
    return palette_color(palette_index(name_));
}

bool UserAvatar::has_image() const {
    return ImageCache::instance().is_loadable(image_path_);
}

SDL_Rect UserAvatar::circle_rect() const {
    const int d = std::min(size_, std::min(rect_.w, rect_.h));
    return wk_draw::centered(rect_, d, d);
}

bool UserAvatar::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_ || !clickable_) return false;
    track_hover(e);
    switch (click_.feed(e, circle_rect())) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        if (on_clicked_) on_clicked_();
        return true;
    default:
        return false;
    }
}

void UserAvatar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Rect c = circle_rect();
    const int radius = c.w / 2;
    const int cx = c.x + radius;
    const int cy = c.y + radius;

    SDL_Texture* tex = nullptr;
    if (display_text_.empty() && has_image()) tex = ImageCache::instance().circular_texture(r, image_path_);
    if (tex) {
        int tw = 0;
        int th = 0;
        SDL_QueryTexture(tex, nullptr, nullptr, &tw, &th);
        const int side = std::min(tw, th);
        const SDL_Rect src{ (tw - side) / 2, (th - side) / 2, side, side };
        SDL_SetTextureAlphaMod(tex, static_cast<Uint8>(255 * alpha));
        SDL_RenderCopy(r, tex, &src, &c);
    } else {
        if (neutral_) {
            wk_draw::fill_circle(r, cx, cy, radius, tm.color("border"), alpha);
            wk_draw::fill_circle(r, cx, cy, radius - 2, background_color(), alpha);
        } else {
            wk_draw::fill_circle(r, cx, cy, radius, background_color(), alpha);
        }
        LabelStyle st = tm.font("default");
        st.font_size = std::max(8, c.w * 4 / 9);
        st.bold = true;
        st.color = neutral_ ? tm.color("text") : wk::rgba(255, 255, 255);
        wk_text::draw_in_rect(r, st, display_text_.empty() ? initials() : display_text_, c,
                              wk_text::Align::Center, alpha);
    }

    if (!status_.empty()) {
        const int d = status_dot_size();
        const int dx = c.x + c.w - d / 2 - 1;
        const int dy = c.y + c.h - d / 2 - 1;
        wk_draw::fill_circle(r, dx, dy, d / 2 + 1, wk::rgba(255, 255, 255), alpha);
        wk_draw::fill_circle(r, dx, dy, std::max(1, d / 2 - 1), status_color(status_), alpha);
    }
}

AvatarGroup::AvatarGroup(int max_visible, int size)
    : max_visible_(std::max(1, max_visible)), size_(size), overflow_(std::make_unique<UserAvatar>("", "", size)) {
    overflow_->set_neutral(true);
    overflow_->set_parent(this);
}

UserAvatar* AvatarGroup::add_avatar(const std::string& name, const std::string& image_path,
                                    const std::string& status) {
    auto avatar = std::make_unique<UserAvatar>(name, image_path, size_, status);
    avatar->set_parent(this);
    UserAvatar* raw = avatar.get();
    avatars_.push_back(std::move(avatar));
    overflow_->set_display_text("+" + std::to_string(overflow_count()));
    layout();
    return raw;
}

void AvatarGroup::clear_avatars() {
    avatars_.clear();
    layout();
}

size_t AvatarGroup::visible_count() const {
    return std::min(avatars_.size(), static_cast<size_t>(max_visible_));
}

size_t AvatarGroup::overflow_count() const {
    return avatars_.size() - visible_count();
}

int AvatarGroup::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int n = static_cast<int>(visible_count() + (overflow_count() > 0 ? 1 : 0));
    if (n == 0) return 0;
    return size_ + (n - 1) * (size_ - overlap());
}

void AvatarGroup::layout() {
    const int step = size_ - overlap();
    const int y = rect_.y + (rect_.h - size_) / 2;
    for (size_t i = 0; i < avatars_.size(); ++i) {
        UserAvatar* a = avatars_[i].get();
        a->set_visible(i < visible_count());
        a->set_rect(SDL_Rect{ rect_.x + static_cast<int>(i) * step, y, size_, size_ });
    }
    overflow_->set_rect(SDL_Rect{ rect_.x + static_cast<int>(visible_count()) * step, y, size_, size_ });
}

bool AvatarGroup::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    // Later avatars are drawn on top, so they get the event first.
    for (size_t i = visible_count(); i-- > 0;) {
        if (avatars_[i]->handle_event(e)) return true;
    }
    return false;
}

void AvatarGroup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    for (size_t i = 0; i < visible_count(); ++i) avatars_[i]->render(r);
    if (overflow_count() > 0) overflow_->render(r);
}
