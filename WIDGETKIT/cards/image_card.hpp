#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "base/base_card.hpp"

class BaseButton;
class IconButton;
class Label;

// Picture scaled to cover its rect, or a neutral placeholder with an image
// glyph when the file is missing.
class ImageView : public Widget {
public:
    explicit ImageView(const std::string& path = {}, int height = 160);

    void set_path(const std::string& p) { path_ = p; }
    const std::string& path() const { return path_; }
    bool has_image() const;
    void set_placeholder_text(const std::string& t) { placeholder_ = t; }
    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    std::string path_;
    int height_;
    std::string placeholder_ = "No image";
    ClickTracker click_;
    std::function<void()> on_clicked_{};
};

class ImageCard : public BaseCard {
public:
    ImageCard(const std::string& title = {}, const std::string& image_path = {},
              const std::string& description = {});

    void set_image(const std::string& path);
    const std::string& image_path() const;
    void set_description(const std::string& d);
    const std::string& description() const;
    ImageView* image_view() const { return image_; }

    void set_on_image_clicked(std::function<void()> cb);

protected:
    ImageView* image_ = nullptr;
    Label* description_ = nullptr;
};

// Image card that pages through a list of pictures. Paging wraps around.
class GalleryCard : public ImageCard {
public:
    explicit GalleryCard(const std::string& title = {}, const std::vector<std::string>& images = {},
                         int current = 0);

    void set_images(const std::vector<std::string>& images);
    const std::vector<std::string>& images() const { return images_; }
    void add_image(const std::string& path);
    bool remove_image(int index);
    int image_count() const { return static_cast<int>(images_.size()); }
    // -1 when there are no images.
    int current_index() const { return index_; }
    void set_current_index(int index);
    void next_image();
    void previous_image();
    // "2 / 5", "0 / 0" when empty.
    std::string counter_text() const;

    void set_on_image_changed(std::function<void(int, const std::string&)> cb) { on_image_changed_ = std::move(cb); }

private:
    void show_current();

    std::vector<std::string> images_;
    int index_ = -1;
    Label* counter_ = nullptr;
    IconButton* prev_ = nullptr;
    IconButton* next_ = nullptr;
    std::function<void(int, const std::string&)> on_image_changed_{};
};

// Row of five stars filled up to the rating, halves included.
class StarRow : public Widget {
public:
    explicit StarRow(double rating = 0.0, int max_stars = 5, int star_size = 14);

    // Clamped to [0, max].
    void set_rating(double r);
    double rating() const { return rating_; }

    int preferred_width() const override;
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : star_size_; }
    void render(SDL_Renderer* r) const override;

private:
    double rating_ = 0.0;
    int max_stars_;
    int star_size_;
};

class ProductCard : public ImageCard {
public:
    ProductCard(const std::string& name = {}, double price = 0.0, const std::string& image_path = {},
                double original_price = 0.0, double rating = 0.0);

    void set_name(const std::string& n) { set_title(n); }
    std::string name() const { return title(); }
    void set_price(double p);
    double price() const { return price_; }
    // Shown struck through with a discount badge when above the price.
    void set_original_price(double p);
    double original_price() const { return original_price_; }
    // Rounded percentage saved against the original price, 0 when there is
    // no discount.
    int discount_percentage() const;
    void set_rating(double r);
    double rating() const;
    void set_currency(const std::string& symbol);

    // "$12.50"
    std::string format_price(double value) const;
    const std::string& price_text() const;
    const std::string& discount_text() const;

    void set_on_add_to_cart(std::function<void()> cb) { on_add_to_cart_ = std::move(cb); }
    BaseButton* cart_button() const { return cart_; }

private:
    void refresh_prices();

    double price_ = 0.0;
    double original_price_ = 0.0;
    std::string currency_ = "$";
    Label* price_label_ = nullptr;
    Label* original_label_ = nullptr;
    Label* discount_label_ = nullptr;
    StarRow* stars_ = nullptr;
    BaseButton* cart_ = nullptr;
    std::function<void()> on_add_to_cart_{};
};
