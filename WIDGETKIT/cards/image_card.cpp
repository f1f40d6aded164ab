#include "image_card.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/image_cache.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kPlaceholderIcon = 32;
constexpr int kStarGap = 2;

// Label with a line through the text.
class StrikeLabel : public Label {
public:
    using Label::Label;

    void render(SDL_Renderer* r) const override {
        Label::render(r);
        if (!visible_ || text().empty()) return;
        const LabelStyle st = style();
        const int w = std::min(rect_.w, wk_text::width(st, text()));
        const int y = rect_.y + rect_.h / 2;
        wk_draw::draw_line(r, rect_.x, y, rect_.x + w, y, st.color, 1, effective_opacity());
    }
};
}

ImageView::ImageView(const std::string& path, int height) : path_(path), height_(height) {}

bool ImageView::has_image() const {
    return ImageCache::instance().is_loadable(path_);
}

int ImageView::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : height_;
}

int ImageView::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : height_;
}

bool ImageView::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_ || !on_clicked_) return false;
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        on_clicked_();
        return true;
    default:
        return false;
    }
}

void ImageView::render(SDL_Renderer* r) const {
    if (!visible_ || rect_.w <= 0 || rect_.h <= 0) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    SDL_Texture* tex = has_image() ? ImageCache::instance().texture(r, path_) : nullptr;
    if (tex) {
        int tw = 0;
        int th = 0;
        SDL_QueryTexture(tex, nullptr, nullptr, &tw, &th);
        if (tw > 0 && th > 0) {
            // Crop the source so the picture covers the rect.
            const float scale = std::max(static_cast<float>(rect_.w) / tw, static_cast<float>(rect_.h) / th);
            const int sw = std::min(tw, static_cast<int>(rect_.w / scale));
            const int sh = std::min(th, static_cast<int>(rect_.h / scale));
            const SDL_Rect src{ (tw - sw) / 2, (th - sh) / 2, sw, sh };
            SDL_SetTextureAlphaMod(tex, static_cast<Uint8>(255 * alpha));
            SDL_RenderCopy(r, tex, &src, &rect_);
            return;
        }
    }
    wk_draw::fill_rect(r, rect_, tm.color("light"), alpha);
    const SDL_Color fg = tm.color("text_secondary");
    const LabelStyle st = tm.font("caption");
    const int text_h = wk_text::line_height(st);
    SDL_Rect icon = wk_draw::centered(rect_, kPlaceholderIcon, kPlaceholderIcon);
    icon.y -= text_h / 2;
    wk_icons::draw(r, "file", icon, fg, alpha);
    LabelStyle caption = st;
    caption.color = fg;
    wk_text::draw_in_rect(r, caption, placeholder_, SDL_Rect{ rect_.x, icon.y + icon.h + 4, rect_.w, text_h },
                          wk_text::Align::Center, alpha);
}

ImageCard::ImageCard(const std::string& title, const std::string& image_path, const std::string& description) {
    image_ = body_->add_widget(std::make_unique<ImageView>(image_path));
    if (!title.empty()) set_title(title);
    auto text = std::make_unique<Label>(description, "default", "text_secondary");
    text->set_word_wrap(true);
    description_ = body_->add_widget(std::move(text));
    description_->set_visible(!description.empty());
}

void ImageCard::set_image(const std::string& path) {
    image_->set_path(path);
}

const std::string& ImageCard::image_path() const {
    return image_->path();
}

void ImageCard::set_description(const std::string& d) {
    description_->set_text(d);
    description_->set_visible(!d.empty());
}

const std::string& ImageCard::description() const {
    return description_->text();
}

void ImageCard::set_on_image_clicked(std::function<void()> cb) {
    image_->set_on_clicked(std::move(cb));
}

GalleryCard::GalleryCard(const std::string& title, const std::vector<std::string>& images, int current)
    : ImageCard(title) {
    auto prev = std::make_unique<IconButton>("chevron-left", 28);
    prev->set_on_clicked([this]() { previous_image(); });
    prev_ = static_cast<IconButton*>(add_footer_widget(std::move(prev)));
    auto counter = std::make_unique<Label>(std::string(), "caption", "text_secondary");
    counter->set_alignment(wk_text::Align::Center);
    counter_ = static_cast<Label*>(footer_->add(std::move(counter), 1));
    auto next = std::make_unique<IconButton>("chevron-right", 28);
    next->set_on_clicked([this]() { next_image(); });
    next_ = static_cast<IconButton*>(add_footer_widget(std::move(next)));

    images_ = images;
    index_ = images_.empty() ? -1 : std::max(0, std::min(current, image_count() - 1));
    show_current();
}

void GalleryCard::show_current() {
    image_->set_path(index_ >= 0 ? images_[static_cast<size_t>(index_)] : std::string());
    counter_->set_text(counter_text());
    prev_->set_enabled(images_.size() > 1);
    next_->set_enabled(images_.size() > 1);
}

std::string GalleryCard::counter_text() const {
    return std::to_string(index_ + 1) + " / " + std::to_string(images_.size());
}

void GalleryCard::set_images(const std::vector<std::string>& images) {
    images_ = images;
    index_ = images_.empty() ? -1 : 0;
    show_current();
    if (index_ >= 0 && on_image_changed_) on_image_changed_(index_, images_[0]);
}

void GalleryCard::add_image(const std::string& path) {
    images_.push_back(path);
    if (index_ < 0) {
        index_ = 0;
        show_current();
        if (on_image_changed_) on_image_changed_(0, path);
        return;
    }
    show_current();
}

bool GalleryCard::remove_image(int index) {
    if (index < 0 || index >= image_count()) return false;
    images_.erase(images_.begin() + index);
    const int before = index_;
    if (images_.empty()) index_ = -1;
    else if (index < index_ || index_ >= image_count()) index_ = std::max(0, index_ - 1);
    show_current();
    if (index == before && index_ >= 0 && on_image_changed_) {
        on_image_changed_(index_, images_[static_cast<size_t>(index_)]);
    }
    return true;
}

void GalleryCard::set_current_index(int index) {
    if (index < 0 || index >= image_count() || index == index_) return;
    index_ = index;
    show_current();
    if (on_image_changed_) on_image_changed_(index_, images_[static_cast<size_t>(index_)]);
}

void GalleryCard::next_image() {
    if (images_.empty()) return;
    set_current_index((index_ + 1) % image_count());
}

void GalleryCard::previous_image() {
    if (images_.empty()) return;
    set_current_index((index_ - 1 + image_count()) % image_count());
}

StarRow::StarRow(double rating, int max_stars, int star_size) : max_stars_(max_stars), star_size_(star_size) {
    set_rating(rating);
}

void StarRow::set_rating(double r) {
    rating_ = std::max(0.0, std::min(static_cast<double>(max_stars_), r));
}

int StarRow::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return max_stars_ * star_size_ + std::max(0, max_stars_ - 1) * kStarGap;
}

void StarRow::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Color on = tm.color("warning");
    const SDL_Color off = tm.color("border");
    const int y = rect_.y + (rect_.h - star_size_) / 2;
    for (int i = 0; i < max_stars_; ++i) {
        const SDL_Rect star{ rect_.x + i * (star_size_ + kStarGap), y, star_size_, star_size_ };
        const double fill = std::max(0.0, std::min(1.0, rating_ - i));
        if (fill >= 1.0) {
            wk_icons::draw(r, "star", star, on, alpha);
            continue;
        }
        wk_icons::draw(r, "star", star, off, alpha);
        if (fill >= 0.5) {
            wk_draw::ClipScope clip(r, SDL_Rect{ star.x, star.y, star.w / 2, star.h });
            wk_icons::draw(r, "star", star, on, alpha);
        }
    }
}

ProductCard::ProductCard(const std::string& name, double price, const std::string& image_path,
                         double original_price, double rating)
    : ImageCard(name, image_path), price_(price), original_price_(original_price) {
    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::item_gap());
    auto price_label = std::make_unique<Label>(std::string(), "heading", "primary");
    price_label->set_bold(true);
    price_label_ = row->add_widget(std::move(price_label));
    original_label_ = row->add_widget(std::make_unique<StrikeLabel>(std::string(), "caption", "text_secondary"));
    discount_label_ = row->add_widget(std::make_unique<Label>(std::string(), "caption", "danger"));
    discount_label_->set_bold(true);
    body_->add(std::move(row));

    stars_ = body_->add_widget(std::make_unique<StarRow>(rating));

    auto cart = std::make_unique<BaseButton>("Add to Cart", ButtonVariant::Primary);
    cart->set_icon("plus");
    cart->set_on_clicked([this]() {
        if (on_add_to_cart_) on_add_to_cart_();
    });
    cart_ = static_cast<BaseButton*>(footer_->add(std::move(cart), 1));
    footer_->show();
    refresh_prices();
}

std::string ProductCard::format_price(double value) const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s%.2f", currency_.c_str(), value);
    return buf;
}

int ProductCard::discount_percentage() const {
    if (original_price_ <= 0.0 || original_price_ <= price_) return 0;
    return static_cast<int>(std::lround((original_price_ - price_) / original_price_ * 100.0));
}

void ProductCard::refresh_prices() {
    price_label_->set_text(format_price(price_));
    const int discount = discount_percentage();
    original_label_->set_text(discount > 0 ? format_price(original_price_) : std::string());
    original_label_->set_visible(discount > 0);
    discount_label_->set_text(discount > 0 ? "-" + std::to_string(discount) + "%" : std::string());
    discount_label_->set_visible(discount > 0);
}

void ProductCard::set_price(double p) {
    price_ = p;
    refresh_prices();
}

void ProductCard::set_original_price(double p) {
    original_price_ = p;
    refresh_prices();
}

void ProductCard::set_rating(double r) {
    stars_->set_rating(r);
}

double ProductCard::rating() const {
    return stars_->rating();
}

void ProductCard::set_currency(const std::string& symbol) {
    currency_ = symbol;
    refresh_prices();
}

const std::string& ProductCard::price_text() const {
    return price_label_->text();
}

const std::string& ProductCard::discount_text() const {
    return discount_label_->text();
}
