#pragma once

#include <SDL.h>
#include <functional>

#include "core/widget.hpp"

// Row of stars. Clicking a star sets the rating to it; clicking the star
// that is already the rating clears it. With half stars the left half of a
// star gives x.5. Hovering previews the rating under the pointer.
class RatingStar : public Widget {
public:
    enum class Size { Small, Medium, Large };
    static constexpr int kSpacing = 2;

    explicit RatingStar(int max_rating = 5, double rating = 0.0, bool read_only = false, Size size = Size::Medium);

    // Clamped to [0, max] and rounded to a whole or half star. Silent.
    void set_rating(double rating);
    double rating() const { return rating_; }
    void set_max_rating(int max_rating);
    int max_rating() const { return max_; }
    void set_half_stars(bool half);
    bool half_stars() const { return half_; }
    void set_read_only(bool read_only);
    bool is_read_only() const { return read_only_; }
    void set_star_size(Size s) { size_ = s; }
    int star_size() const;

    // 0 when the pointer is not over a star.
    double hover_rating() const { return hover_; }
    // What the stars show: the hover preview if any, else the rating.
    double displayed_rating() const { return hover_ > 0.0 ? hover_ : rating_; }
    SDL_Rect star_rect(int index) const;

    void set_on_rating_changed(std::function<void(double)> cb) { on_rating_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void on_hover_changed(bool hovered) override;

private:
    double snap(double v) const;
    // Rating for a pointer position, 0 outside the stars.
    double value_at(SDL_Point p) const;

    int max_;
    double rating_ = 0.0;
    bool read_only_;
    bool half_ = false;
    Size size_;
    double hover_ = 0.0;
    double pressed_ = 0.0;
    std::function<void(double)> on_rating_changed_{};
};
