#pragma once

#include <SDL.h>

namespace wk_draw {

enum class Direction { Up, Down, Left, Right };

void set_color(SDL_Renderer* r, SDL_Color c, float alpha = 1.0f);
void fill_rect(SDL_Renderer* r, const SDL_Rect& rect, SDL_Color c, float alpha = 1.0f);
void draw_rect(SDL_Renderer* r, const SDL_Rect& rect, SDL_Color c, float alpha = 1.0f);
void fill_rounded_rect(SDL_Renderer* r, const SDL_Rect& rect, int radius, SDL_Color c, float alpha = 1.0f);
void draw_rounded_rect(SDL_Renderer* r, const SDL_Rect& rect, int radius, SDL_Color c, float alpha = 1.0f);
void fill_circle(SDL_Renderer* r, int cx, int cy, int radius, SDL_Color c, float alpha = 1.0f);
void draw_circle(SDL_Renderer* r, int cx, int cy, int radius, SDL_Color c, float alpha = 1.0f);
void draw_line(SDL_Renderer* r, int x1, int y1, int x2, int y2, SDL_Color c, int thickness = 1,
               float alpha = 1.0f);
void fill_triangle(SDL_Renderer* r, SDL_Point a, SDL_Point b, SDL_Point c, SDL_Color col, float alpha = 1.0f);
// Small arrow head centred in `area`.
void draw_chevron(SDL_Renderer* r, const SDL_Rect& area, Direction dir, SDL_Color c, float alpha = 1.0f);
void draw_check(SDL_Renderer* r, const SDL_Rect& area, SDL_Color c, float alpha = 1.0f);
void draw_cross(SDL_Renderer* r, const SDL_Rect& area, SDL_Color c, float alpha = 1.0f);
// Soft shadow built from stacked translucent rounded rects.
void draw_shadow(SDL_Renderer* r, const SDL_Rect& rect, int radius, int spread, SDL_Color c,
                 float alpha = 1.0f);

SDL_Rect inset(const SDL_Rect& r, int dx, int dy);
SDL_Rect centered(const SDL_Rect& outer, int w, int h);
SDL_Rect intersect(const SDL_Rect& a, const SDL_Rect& b);

// Clears the alpha of every pixel outside the inscribed circle of an
// SDL_PIXELFORMAT_RGBA32 surface.
void mask_circle(SDL_Surface* surf);

// Restricts drawing to `area` (intersected with any active clip) for the
// lifetime of the object.
class ClipScope {
public:
    ClipScope(SDL_Renderer* r, const SDL_Rect& area);
    ~ClipScope();
    ClipScope(const ClipScope&) = delete;
    ClipScope& operator=(const ClipScope&) = delete;

private:
    SDL_Renderer* r_ = nullptr;
    SDL_Rect prev_clip_{0,0,0,0};
    SDL_bool was_clipping_ = SDL_FALSE;
};

}
