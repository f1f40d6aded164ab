#include "icons.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>

#include "draw_utils.hpp"
#include "style/theme_manager.hpp"
#include "text.hpp"

namespace {

struct Box {
    int cx;
    int cy;
    int s;
    int u() const { return std::max(1, s / 16); }
    int x(int units16) const { return cx - s / 2 + units16 * s / 16; }
    int y(int units16) const { return cy - s / 2 + units16 * s / 16; }
};

using Painter = std::function<void(SDL_Renderer*, const Box&, SDL_Color, float)>;

void star(SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
    const double outer = b.s * 0.48;
    const double inner = outer * 0.45;
    SDL_Point pts[10];
    for (int i = 0; i < 10; ++i) {
        const double rad = (i % 2 == 0) ? outer : inner;
        const double ang = -M_PI / 2.0 + i * M_PI / 5.0;
        pts[i] = SDL_Point{ b.cx + static_cast<int>(std::lround(rad * std::cos(ang))),
                            b.cy + static_cast<int>(std::lround(rad * std::sin(ang))) };
    }
    const SDL_Point center{ b.cx, b.cy };
    for (int i = 0; i < 10; ++i) {
        wk_draw::fill_triangle(r, center, pts[i], pts[(i + 1) % 10], c, a);
    }
}

const std::map<std::string, Painter>& painters() {
    using namespace wk_draw;
    static const std::map<std::string, Painter> table = {
        { "close", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_cross(r, SDL_Rect{ b.x(3), b.y(3), b.s * 10 / 16, b.s * 10 / 16 }, c, a);
          } },
        { "check", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_check(r, SDL_Rect{ b.x(2), b.y(3), b.s * 12 / 16, b.s * 10 / 16 }, c, a);
          } },
        { "plus", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_line(r, b.x(3), b.cy, b.x(13), b.cy, c, b.u() + 1, a);
              draw_line(r, b.cx, b.y(3), b.cx, b.y(13), c, b.u() + 1, a);
          } },
        { "minus", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_line(r, b.x(3), b.cy, b.x(13), b.cy, c, b.u() + 1, a);
          } },
        { "chevron-up", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_chevron(r, SDL_Rect{ b.x(0), b.y(0), b.s, b.s }, Direction::Up, c, a);
          } },
        { "chevron-down", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_chevron(r, SDL_Rect{ b.x(0), b.y(0), b.s, b.s }, Direction::Down, c, a);
          } },
        { "chevron-left", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_chevron(r, SDL_Rect{ b.x(0), b.y(0), b.s, b.s }, Direction::Left, c, a);
          } },
        { "chevron-right", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_chevron(r, SDL_Rect{ b.x(0), b.y(0), b.s, b.s }, Direction::Right, c, a);
          } },
        { "menu", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              for (int row : { 4, 8, 12 }) draw_line(r, b.x(2), b.y(row), b.x(14), b.y(row), c, b.u() + 1, a);
          } },
        { "more", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              for (int col : { 3, 8, 13 }) fill_circle(r, b.x(col), b.cy, std::max(1, b.s / 12), c, a);
          } },
        { "dot", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_circle(r, b.cx, b.cy, b.s / 4, c, a);
          } },
        { "search", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.x(7), b.y(7), b.s * 5 / 16, c, a);
              draw_line(r, b.x(10), b.y(10), b.x(14), b.y(14), c, b.u() + 1, a);
          } },
        { "star", star },
        { "heart", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              const int rad = b.s / 4;
              fill_circle(r, b.x(5), b.y(6), rad, c, a);
              fill_circle(r, b.x(11), b.y(6), rad, c, a);
              fill_triangle(r, SDL_Point{ b.x(1), b.y(7) }, SDL_Point{ b.x(15), b.y(7) },
                            SDL_Point{ b.cx, b.y(15) }, c, a);
          } },
        { "info", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s * 7 / 16, c, a);
              fill_circle(r, b.cx, b.y(5), std::max(1, b.s / 14), c, a);
              draw_line(r, b.cx, b.y(7), b.cx, b.y(12), c, b.u() + 1, a);
          } },
        { "warning", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              const SDL_Point top{ b.cx, b.y(1) };
              const SDL_Point left{ b.x(1), b.y(15) };
              const SDL_Point right{ b.x(15), b.y(15) };
              draw_line(r, top.x, top.y, left.x, left.y, c, b.u(), a);
              draw_line(r, left.x, left.y, right.x, right.y, c, b.u(), a);
              draw_line(r, right.x, right.y, top.x, top.y, c, b.u(), a);
              draw_line(r, b.cx, b.y(6), b.cx, b.y(10), c, b.u() + 1, a);
              fill_circle(r, b.cx, b.y(13), std::max(1, b.s / 16), c, a);
          } },
        { "error", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s * 7 / 16, c, a);
              draw_cross(r, SDL_Rect{ b.x(5), b.y(5), b.s * 6 / 16, b.s * 6 / 16 }, c, a);
          } },
        { "success", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s * 7 / 16, c, a);
              draw_check(r, SDL_Rect{ b.x(4), b.y(5), b.s / 2, b.s * 6 / 16 }, c, a);
          } },
        { "settings", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s / 4, c, a);
              for (int i = 0; i < 8; ++i) {
                  const double ang = i * M_PI / 4.0;
                  const int x1 = b.cx + static_cast<int>(std::cos(ang) * b.s * 5 / 16);
                  const int y1 = b.cy + static_cast<int>(std::sin(ang) * b.s * 5 / 16);
                  const int x2 = b.cx + static_cast<int>(std::cos(ang) * b.s * 7 / 16);
                  const int y2 = b.cy + static_cast<int>(std::sin(ang) * b.s * 7 / 16);
                  draw_line(r, x1, y1, x2, y2, c, b.u() + 1, a);
              }
          } },
        { "user", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_circle(r, b.cx, b.y(5), b.s * 3 / 16, c, a);
              fill_rounded_rect(r, SDL_Rect{ b.x(3), b.y(10), b.s * 10 / 16, b.s * 5 / 16 }, b.s / 6, c, a);
          } },
        { "users", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_circle(r, b.x(5), b.y(5), b.s / 8, c, a);
              fill_circle(r, b.x(11), b.y(5), b.s / 8, c, a);
              fill_rounded_rect(r, SDL_Rect{ b.x(1), b.y(9), b.s * 7 / 16, b.s * 5 / 16 }, b.s / 8, c, a);
              fill_rounded_rect(r, SDL_Rect{ b.x(8), b.y(9), b.s * 7 / 16, b.s * 5 / 16 }, b.s / 8, c, a);
          } },
        { "folder", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_rect(r, SDL_Rect{ b.x(1), b.y(3), b.s * 6 / 16, b.s * 2 / 16 }, c, a);
              fill_rounded_rect(r, SDL_Rect{ b.x(1), b.y(5), b.s * 14 / 16, b.s * 9 / 16 }, 2, c, a);
          } },
        { "file", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              const SDL_Rect page{ b.x(3), b.y(1), b.s * 10 / 16, b.s * 14 / 16 };
              draw_rect(r, page, c, a);
              draw_line(r, b.x(5), b.y(6), b.x(11), b.y(6), c, 1, a);
              draw_line(r, b.x(5), b.y(9), b.x(11), b.y(9), c, 1, a);
              draw_line(r, b.x(5), b.y(12), b.x(9), b.y(12), c, 1, a);
          } },
        { "play", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_triangle(r, SDL_Point{ b.x(4), b.y(2) }, SDL_Point{ b.x(4), b.y(14) },
                            SDL_Point{ b.x(14), b.cy }, c, a);
          } },
        { "pause", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_rect(r, SDL_Rect{ b.x(4), b.y(3), b.s * 3 / 16, b.s * 10 / 16 }, c, a);
              fill_rect(r, SDL_Rect{ b.x(9), b.y(3), b.s * 3 / 16, b.s * 10 / 16 }, c, a);
          } },
        { "stop", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_rect(r, SDL_Rect{ b.x(4), b.y(4), b.s / 2, b.s / 2 }, c, a);
          } },
        { "trash", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_line(r, b.x(2), b.y(4), b.x(14), b.y(4), c, b.u() + 1, a);
              draw_line(r, b.x(6), b.y(2), b.x(10), b.y(2), c, b.u(), a);
              draw_rect(r, SDL_Rect{ b.x(4), b.y(5), b.s / 2, b.s * 10 / 16 }, c, a);
          } },
        { "edit", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_line(r, b.x(4), b.y(12), b.x(13), b.y(3), c, b.u() + 2, a);
              fill_triangle(r, SDL_Point{ b.x(2), b.y(14) }, SDL_Point{ b.x(3), b.y(10) },
                            SDL_Point{ b.x(6), b.y(13) }, c, a);
          } },
        { "pin", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_circle(r, b.cx, b.y(5), b.s * 4 / 16, c, a);
              draw_line(r, b.cx, b.y(8), b.cx, b.y(15), c, b.u() + 1, a);
          } },
        { "copy", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_rect(r, SDL_Rect{ b.x(2), b.y(2), b.s * 9 / 16, b.s * 9 / 16 }, c, a);
              draw_rect(r, SDL_Rect{ b.x(5), b.y(5), b.s * 9 / 16, b.s * 9 / 16 }, c, a);
          } },
        { "bell", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_rounded_rect(r, SDL_Rect{ b.x(4), b.y(2), b.s / 2, b.s * 10 / 16 }, b.s / 5, c, a);
              draw_line(r, b.x(2), b.y(12), b.x(14), b.y(12), c, b.u() + 1, a);
              fill_circle(r, b.cx, b.y(14), std::max(1, b.s / 10), c, a);
          } },
        { "home", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_triangle(r, SDL_Point{ b.cx, b.y(1) }, SDL_Point{ b.x(1), b.y(8) },
                            SDL_Point{ b.x(15), b.y(8) }, c, a);
              fill_rect(r, SDL_Rect{ b.x(3), b.y(8), b.s * 10 / 16, b.s * 7 / 16 }, c, a);
          } },
        { "grid", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              const int cell = b.s * 6 / 16;
              fill_rect(r, SDL_Rect{ b.x(1), b.y(1), cell, cell }, c, a);
              fill_rect(r, SDL_Rect{ b.x(9), b.y(1), cell, cell }, c, a);
              fill_rect(r, SDL_Rect{ b.x(1), b.y(9), cell, cell }, c, a);
              fill_rect(r, SDL_Rect{ b.x(9), b.y(9), cell, cell }, c, a);
          } },
        { "chart", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_rect(r, SDL_Rect{ b.x(2), b.y(9), b.s * 3 / 16, b.s * 6 / 16 }, c, a);
              fill_rect(r, SDL_Rect{ b.x(7), b.y(4), b.s * 3 / 16, b.s * 11 / 16 }, c, a);
              fill_rect(r, SDL_Rect{ b.x(12), b.y(7), b.s * 3 / 16, b.s * 8 / 16 }, c, a);
          } },
        { "calendar", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_rect(r, SDL_Rect{ b.x(1), b.y(3), b.s * 14 / 16, b.s * 12 / 16 }, c, a);
              fill_rect(r, SDL_Rect{ b.x(1), b.y(3), b.s * 14 / 16, b.s * 3 / 16 }, c, a);
              for (int row : { 9, 12 }) {
                  for (int col : { 4, 8, 12 }) fill_circle(r, b.x(col), b.y(row), std::max(1, b.s / 16), c, a);
              }
          } },
        { "refresh", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s * 6 / 16, c, a);
              fill_triangle(r, SDL_Point{ b.x(11), b.y(1) }, SDL_Point{ b.x(15), b.y(4) },
                            SDL_Point{ b.x(10), b.y(5) }, c, a);
          } },
        { "mail", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_rect(r, SDL_Rect{ b.x(1), b.y(3), b.s * 14 / 16, b.s * 10 / 16 }, c, a);
              draw_line(r, b.x(1), b.y(3), b.cx, b.y(9), c, b.u(), a);
              draw_line(r, b.cx, b.y(9), b.x(15), b.y(3), c, b.u(), a);
          } },
        { "send", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              fill_triangle(r, SDL_Point{ b.x(1), b.y(2) }, SDL_Point{ b.x(15), b.cy },
                            SDL_Point{ b.x(1), b.y(14) }, c, a);
          } },
        { "help", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_circle(r, b.cx, b.cy, b.s * 7 / 16, c, a);
              LabelStyle st = ThemeManager::instance().font("default");
              st.font_size = std::max(6, b.s * 9 / 16);
              st.color = c;
              st.bold = true;
              wk_text::draw_in_rect(r, st, "?", SDL_Rect{ b.x(0), b.y(0), b.s, b.s }, wk_text::Align::Center, a);
          } },
        { "clipboard", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_rect(r, SDL_Rect{ b.x(3), b.y(2), b.s * 10 / 16, b.s * 13 / 16 }, c, a);
              fill_rect(r, SDL_Rect{ b.x(6), b.y(1), b.s * 4 / 16, b.s * 3 / 16 }, c, a);
          } },
        { "keyboard", [](SDL_Renderer* r, const Box& b, SDL_Color c, float a) {
              draw_rounded_rect(r, SDL_Rect{ b.x(1), b.y(4), b.s * 14 / 16, b.s * 9 / 16 }, 2, c, a);
              for (int col : { 4, 7, 10, 13 }) fill_circle(r, b.x(col) - 1, b.y(7), std::max(1, b.s / 20), c, a);
              draw_line(r, b.x(4), b.y(10), b.x(12), b.y(10), c, b.u(), a);
          } },
    };
    return table;
}

}

namespace wk_icons {

bool has(const std::string& name) {
    return painters().count(name) > 0;
}

std::vector<std::string> names() {
    std::vector<std::string> out;
    for (const auto& kv : painters()) out.push_back(kv.first);
    return out;
}

void draw(SDL_Renderer* r, const std::string& name, const SDL_Rect& area, SDL_Color c, float alpha) {
    if (!r || name.empty() || area.w <= 0 || area.h <= 0) return;
    auto it = painters().find(name);
    if (it == painters().end()) {
        LabelStyle st = ThemeManager::instance().font("default");
        st.font_size = std::max(6, std::min(area.w, area.h) * 2 / 3);
        st.color = c;
        wk_text::draw_in_rect(r, st, name, area, wk_text::Align::Center, alpha);
        return;
    }
    const int s = std::min(area.w, area.h);
    const Box box{ area.x + area.w / 2, area.y + area.h / 2, s };
    it->second(r, box, c, alpha);
}

}
