#include "draw_utils.hpp"

#include <algorithm>
#include <cmath>

namespace {
Uint8 scaled_alpha(Uint8 a, float alpha) {
    alpha = std::max(0.0f, std::min(1.0f, alpha));
    return static_cast<Uint8>(std::lround(a * alpha));
}

// Horizontal extent of a rounded rect row, measured from the rect edge.
int corner_inset(int dy, int radius) {
    if (radius <= 0 || dy >= radius) return 0;
    const double d = radius - dy - 0.5;
    const double x = std::sqrt(std::max(0.0, static_cast<double>(radius) * radius - d * d));
    return radius - static_cast<int>(std::lround(x));
}
}

namespace wk_draw {

void set_color(SDL_Renderer* r, SDL_Color c, float alpha) {
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, scaled_alpha(c.a, alpha));
}

void fill_rect(SDL_Renderer* r, const SDL_Rect& rect, SDL_Color c, float alpha) {
    if (rect.w <= 0 || rect.h <= 0) return;
    set_color(r, c, alpha);
    SDL_RenderFillRect(r, &rect);
}

void draw_rect(SDL_Renderer* r, const SDL_Rect& rect, SDL_Color c, float alpha) {
    if (rect.w <= 0 || rect.h <= 0) return;
    set_color(r, c, alpha);
    SDL_RenderDrawRect(r, &rect);
}

void fill_rounded_rect(SDL_Renderer* r, const SDL_Rect& rect, int radius, SDL_Color c, float alpha) {
    if (rect.w <= 0 || rect.h <= 0) return;
    radius = std::max(0, std::min(radius, std::min(rect.w, rect.h) / 2));
    if (radius == 0) { fill_rect(r, rect, c, alpha); return; }
    set_color(r, c, alpha);
    SDL_Rect middle{ rect.x, rect.y + radius, rect.w, rect.h - 2 * radius };
    SDL_RenderFillRect(r, &middle);
    for (int dy = 0; dy < radius; ++dy) {
        const int in = corner_inset(dy, radius);
        const int w = rect.w - 2 * in;
        if (w <= 0) continue;
        SDL_RenderDrawLine(r, rect.x + in, rect.y + dy, rect.x + in + w - 1, rect.y + dy);
        SDL_RenderDrawLine(r, rect.x + in, rect.y + rect.h - 1 - dy, rect.x + in + w - 1, rect.y + rect.h - 1 - dy);
    }
}

void draw_rounded_rect(SDL_Renderer* r, const SDL_Rect& rect, int radius, SDL_Color c, float alpha) {
    if (rect.w <= 0 || rect.h <= 0) return;
    radius = std::max(0, std::min(radius, std::min(rect.w, rect.h) / 2));
    if (radius == 0) { draw_rect(r, rect, c, alpha); return; }
    set_color(r, c, alpha);
    const int x0 = rect.x, y0 = rect.y, x1 = rect.x + rect.w - 1, y1 = rect.y + rect.h - 1;
    SDL_RenderDrawLine(r, x0 + radius, y0, x1 - radius, y0);
    SDL_RenderDrawLine(r, x0 + radius, y1, x1 - radius, y1);
    SDL_RenderDrawLine(r, x0, y0 + radius, x0, y1 - radius);
    SDL_RenderDrawLine(r, x1, y0 + radius, x1, y1 - radius);
    int prev = corner_inset(0, radius);
    for (int dy = 0; dy < radius; ++dy) {
        const int in = corner_inset(dy, radius);
        const int from = std::min(in, prev);
        const int to = std::max(in, prev);
        SDL_RenderDrawLine(r, x0 + from, y0 + dy, x0 + to, y0 + dy);
        SDL_RenderDrawLine(r, x1 - to, y0 + dy, x1 - from, y0 + dy);
        SDL_RenderDrawLine(r, x0 + from, y1 - dy, x0 + to, y1 - dy);
        SDL_RenderDrawLine(r, x1 - to, y1 - dy, x1 - from, y1 - dy);
        prev = in;
    }
}

void fill_circle(SDL_Renderer* r, int cx, int cy, int radius, SDL_Color c, float alpha) {
    if (radius <= 0) return;
    set_color(r, c, alpha);
    for (int y = -radius; y <= radius; ++y) {
        int xr = static_cast<int>(std::sqrt(static_cast<double>(radius * radius - y * y)));
        SDL_RenderDrawLine(r, cx - xr, cy + y, cx + xr, cy + y);
    }
}

void draw_circle(SDL_Renderer* r, int cx, int cy, int radius, SDL_Color c, float alpha) {
    if (radius <= 0) return;
    set_color(r, c, alpha);
    int x = radius, y = 0, err = 1 - radius;
    while (x >= y) {
        const SDL_Point pts[8] = {
            {cx + x, cy + y}, {cx + y, cy + x}, {cx - y, cy + x}, {cx - x, cy + y},
            {cx - x, cy - y}, {cx - y, cy - x}, {cx + y, cy - x}, {cx + x, cy - y}};
        SDL_RenderDrawPoints(r, pts, 8);
        ++y;
        if (err < 0) {
            err += 2 * y + 1;
        } else {
            --x;
            err += 2 * (y - x) + 1;
        }
    }
}

void draw_line(SDL_Renderer* r, int x1, int y1, int x2, int y2, SDL_Color c, int thickness, float alpha) {
    set_color(r, c, alpha);
    if (thickness <= 1) {
        SDL_RenderDrawLine(r, x1, y1, x2, y2);
        return;
    }
    const bool steep = std::abs(y2 - y1) > std::abs(x2 - x1);
    const int half = thickness / 2;
    for (int i = -half; i < thickness - half; ++i) {
        if (steep) SDL_RenderDrawLine(r, x1 + i, y1, x2 + i, y2);
        else SDL_RenderDrawLine(r, x1, y1 + i, x2, y2 + i);
    }
}

void fill_triangle(SDL_Renderer* r, SDL_Point a, SDL_Point b, SDL_Point c, SDL_Color col, float alpha) {
    set_color(r, col, alpha);
    const int min_y = std::min(a.y, std::min(b.y, c.y));
    const int max_y = std::max(a.y, std::max(b.y, c.y));
    const SDL_Point pts[3] = {a, b, c};
    for (int y = min_y; y <= max_y; ++y) {
        double xs[3];
        int n = 0;
        for (int i = 0; i < 3; ++i) {
            const SDL_Point& p = pts[i];
            const SDL_Point& q = pts[(i + 1) % 3];
            if (p.y == q.y) continue;
            if ((y < std::min(p.y, q.y)) || (y > std::max(p.y, q.y))) continue;
            const double t = static_cast<double>(y - p.y) / (q.y - p.y);
            if (n < 3) xs[n++] = p.x + t * (q.x - p.x);
        }
        if (n < 2) continue;
        double lo = xs[0], hi = xs[0];
        for (int i = 1; i < n; ++i) { lo = std::min(lo, xs[i]); hi = std::max(hi, xs[i]); }
        SDL_RenderDrawLine(r, static_cast<int>(std::lround(lo)), y, static_cast<int>(std::lround(hi)), y);
    }
}

void draw_chevron(SDL_Renderer* r, const SDL_Rect& area, Direction dir, SDL_Color c, float alpha) {
    const int s = std::max(2, std::min(area.w, area.h) / 3);
    const int cx = area.x + area.w / 2;
    const int cy = area.y + area.h / 2;
    switch (dir) {
    case Direction::Up:
        fill_triangle(r, {cx - s, cy + s / 2}, {cx + s, cy + s / 2}, {cx, cy - s / 2}, c, alpha);
        break;
    case Direction::Down:
        fill_triangle(r, {cx - s, cy - s / 2}, {cx + s, cy - s / 2}, {cx, cy + s / 2}, c, alpha);
        break;
    case Direction::Left:
        fill_triangle(r, {cx + s / 2, cy - s}, {cx + s / 2, cy + s}, {cx - s / 2, cy}, c, alpha);
        break;
    case Direction::Right:
        fill_triangle(r, {cx - s / 2, cy - s}, {cx - s / 2, cy + s}, {cx + s / 2, cy}, c, alpha);
        break;
    }
}

void draw_check(SDL_Renderer* r, const SDL_Rect& area, SDL_Color c, float alpha) {
    const int x0 = area.x + area.w / 5;
    const int y0 = area.y + area.h / 2;
    const int x1 = area.x + area.w * 2 / 5;
    const int y1 = area.y + area.h * 3 / 4;
    const int x2 = area.x + area.w * 4 / 5;
    const int y2 = area.y + area.h / 4;
    draw_line(r, x0, y0, x1, y1, c, 2, alpha);
    draw_line(r, x1, y1, x2, y2, c, 2, alpha);
}

void draw_cross(SDL_Renderer* r, const SDL_Rect& area, SDL_Color c, float alpha) {
    const int pad = std::max(2, std::min(area.w, area.h) / 4);
    draw_line(r, area.x + pad, area.y + pad, area.x + area.w - pad, area.y + area.h - pad, c, 2, alpha);
    draw_line(r, area.x + area.w - pad, area.y + pad, area.x + pad, area.y + area.h - pad, c, 2, alpha);
}

void draw_shadow(SDL_Renderer* r, const SDL_Rect& rect, int radius, int spread, SDL_Color c, float alpha) {
    for (int i = spread; i > 0; --i) {
        SDL_Rect s{ rect.x - i, rect.y - i + spread / 2, rect.w + 2 * i, rect.h + 2 * i };
        const float layer = alpha / static_cast<float>(spread + 1);
        fill_rounded_rect(r, s, radius + i, c, layer);
    }
}

SDL_Rect inset(const SDL_Rect& r, int dx, int dy) {
    return SDL_Rect{ r.x + dx, r.y + dy, std::max(0, r.w - 2 * dx), std::max(0, r.h - 2 * dy) };
}

SDL_Rect centered(const SDL_Rect& outer, int w, int h) {
    return SDL_Rect{ outer.x + (outer.w - w) / 2, outer.y + (outer.h - h) / 2, w, h };
}

SDL_Rect intersect(const SDL_Rect& a, const SDL_Rect& b) {
    SDL_Rect out{0, 0, 0, 0};
    if (SDL_IntersectRect(&a, &b, &out) == SDL_TRUE) return out;
    return SDL_Rect{ a.x, a.y, 0, 0 };
}

void mask_circle(SDL_Surface* surf) {
    if (!surf || surf->format->format != SDL_PIXELFORMAT_RGBA32) return;
    SDL_LockSurface(surf);
    Uint8* pixels = static_cast<Uint8*>(surf->pixels);
    const int pitch = surf->pitch;
    const int w = surf->w;
    const int h = surf->h;
    const double r = std::min(w, h) / 2.0;
    const double cx = w / 2.0;
    const double cy = h / 2.0;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const double dx = x + 0.5 - cx;
            const double dy = y + 0.5 - cy;
            if (dx * dx + dy * dy > r * r) {
                Uint8* p = pixels + y * pitch + x * 4;
                p[3] = 0;
            }
        }
    }
    SDL_UnlockSurface(surf);
}

ClipScope::ClipScope(SDL_Renderer* r, const SDL_Rect& area) : r_(r) {
    if (!r_) return;
    SDL_RenderGetClipRect(r_, &prev_clip_);
#if SDL_VERSION_ATLEAST(2,0,4)
    was_clipping_ = SDL_RenderIsClipEnabled(r_);
#else
    was_clipping_ = (prev_clip_.w != 0 || prev_clip_.h != 0) ? SDL_TRUE : SDL_FALSE;
#endif
    SDL_Rect clip = area;
    if (was_clipping_ == SDL_TRUE) clip = intersect(prev_clip_, area);
    // An empty clip rect would disable clipping altogether.
    if (clip.w <= 0 || clip.h <= 0) clip = SDL_Rect{ -2, -2, 1, 1 };
    SDL_RenderSetClipRect(r_, &clip);
}

ClipScope::~ClipScope() {
    if (!r_) return;
    if (was_clipping_ == SDL_TRUE) {
        SDL_RenderSetClipRect(r_, &prev_clip_);
    } else {
        SDL_RenderSetClipRect(r_, nullptr);
    }
}

}
