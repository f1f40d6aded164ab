#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

namespace {

struct FontCache {
    std::map<std::string, TTF_Font*> fonts;
    std::set<std::string> failed;

    ~FontCache() { release(); }

    void release() {
        if (TTF_WasInit()) {
            for (auto& kv : fonts) {
                if (kv.second) TTF_CloseFont(kv.second);
            }
        }
        fonts.clear();
        failed.clear();
    }
};

FontCache& cache() {
    static FontCache c;
    return c;
}

std::string cache_key(const LabelStyle& style) {
    std::ostringstream oss;
    oss << style.font_path << '|' << style.font_size << '|' << (style.bold ? 'b' : 'r');
    return oss.str();
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

int estimated_width(const LabelStyle& style, const std::string& s) {
    return static_cast<int>(std::lround(wk_text::utf8_length(s) * style.font_size * 0.55));
}

int estimated_height(const LabelStyle& style) {
    return static_cast<int>(std::lround(style.font_size * 1.2));
}

}

namespace wk_text {

TTF_Font* font(const LabelStyle& style) {
    if (!TTF_WasInit() || style.font_path.empty() || style.font_size <= 0) return nullptr;
    FontCache& c = cache();
    const std::string key = cache_key(style);
    auto it = c.fonts.find(key);
    if (it != c.fonts.end()) return it->second;
    if (c.failed.count(key)) return nullptr;
    TTF_Font* f = style.open_font();
    if (!f) {
        SDL_Log("Failed to open font %s (%d px): %s", style.font_path.c_str(), style.font_size, TTF_GetError());
        c.failed.insert(key);
        return nullptr;
    }
    if (style.bold) TTF_SetFontStyle(f, TTF_STYLE_BOLD);
    c.fonts[key] = f;
    return f;
}

void clear_cache() {
    cache().release();
}

SDL_Point measure(const LabelStyle& style, const std::string& s) {
    TTF_Font* f = font(style);
    if (!f) {
        return SDL_Point{ estimated_width(style, s), estimated_height(style) };
    }
    int w = 0, h = 0;
    if (s.empty()) {
        return SDL_Point{ 0, TTF_FontHeight(f) };
    }
    if (TTF_SizeUTF8(f, s.c_str(), &w, &h) != 0) {
        return SDL_Point{ estimated_width(style, s), estimated_height(style) };
    }
    return SDL_Point{ w, h };
}

int width(const LabelStyle& style, const std::string& s) {
    return measure(style, s).x;
}

int line_height(const LabelStyle& style) {
    TTF_Font* f = font(style);
    return f ? TTF_FontHeight(f) : estimated_height(style);
}

std::vector<std::string> wrap_lines(const LabelStyle& style, const std::string& s, int max_width) {
    std::vector<std::string> out;
    max_width = std::max(1, max_width);
    size_t start = 0;
    auto push_wrapped = [&](const std::string& para) {
        if (para.empty()) { out.emplace_back(""); return; }
        size_t pos = 0;
        while (pos < para.size()) {
            size_t best_break = pos;
            size_t last_space = std::string::npos;
            for (size_t i = pos; i <= para.size(); i = (i < para.size() ? utf8_next(para, i) : i + 1)) {
                std::string trial = para.substr(pos, i - pos);
                if (width(style, trial) <= max_width) {
                    best_break = i;
                    if (i < para.size() && std::isspace(static_cast<unsigned char>(para[i]))) last_space = i;
                    if (i == para.size()) break;
                } else break;
            }
            size_t brk = best_break;
            if (brk < para.size() && last_space != std::string::npos && last_space > pos) brk = last_space;
            if (brk == pos) brk = utf8_next(para, pos);
            std::string ln = para.substr(pos, brk - pos);
            while (!ln.empty() && std::isspace(static_cast<unsigned char>(ln.back()))) ln.pop_back();
            out.push_back(ln);
            pos = brk;
            while (pos < para.size() && std::isspace(static_cast<unsigned char>(para[pos]))) ++pos;
        }
    };
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) { push_wrapped(s.substr(start)); break; }
        push_wrapped(s.substr(start, nl - start));
        start = nl + 1;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

int wrapped_height(const LabelStyle& style, const std::string& s, int max_width, int line_gap) {
    const auto lines = wrap_lines(style, s, max_width);
    const int lh = line_height(style);
    return static_cast<int>(lines.size()) * lh + static_cast<int>(lines.size() - 1) * line_gap;
}

std::string elide(const LabelStyle& style, const std::string& s, int max_width) {
    if (width(style, s) <= max_width) return s;
    const std::string dots = "...";
    std::string cut = s;
    while (!cut.empty()) {
        cut.erase(utf8_prev(cut, cut.size()));
        if (width(style, cut + dots) <= max_width) return cut + dots;
    }
    return width(style, dots) <= max_width ? dots : std::string{};
}

SDL_Point draw(SDL_Renderer* r, const LabelStyle& style, const std::string& s, int x, int y, float alpha) {
    if (!r || s.empty()) return SDL_Point{ 0, 0 };
    TTF_Font* f = font(style);
    if (!f) return SDL_Point{ 0, 0 };
    SDL_Color col = style.color;
    col.a = static_cast<Uint8>(std::max(0.0f, std::min(1.0f, alpha)) * col.a);
    SDL_Surface* surf = TTF_RenderUTF8_Blended(f, s.c_str(), col);
    if (!surf) return SDL_Point{ 0, 0 };
    SDL_Point size{ surf->w, surf->h };
    SDL_Texture* tex = SDL_CreateTextureFromSurface(r, surf);
    if (tex) {
        SDL_SetTextureAlphaMod(tex, col.a);
        SDL_Rect dst{ x, y, surf->w, surf->h };
        SDL_RenderCopy(r, tex, nullptr, &dst);
        SDL_DestroyTexture(tex);
    }
    SDL_FreeSurface(surf);
    return size;
}

void draw_in_rect(SDL_Renderer* r, const LabelStyle& style, const std::string& s, const SDL_Rect& rect,
                  Align align, float alpha) {
    const std::string shown = elide(style, s, rect.w);
    const SDL_Point size = measure(style, shown);
    int x = rect.x;
    if (align == Align::Center) x = rect.x + (rect.w - size.x) / 2;
    else if (align == Align::Right) x = rect.x + rect.w - size.x;
    const int y = rect.y + (rect.h - size.y) / 2;
    draw(r, style, shown, x, y, alpha);
}

int draw_wrapped(SDL_Renderer* r, const LabelStyle& style, const std::string& s, int x, int y,
                 int max_width, int line_gap, float alpha) {
    const auto lines = wrap_lines(style, s, max_width);
    const int lh = line_height(style);
    int line_y = y;
    for (size_t i = 0; i < lines.size(); ++i) {
        draw(r, style, lines[i], x, line_y, alpha);
        line_y += lh;
        if (i + 1 < lines.size()) line_y += line_gap;
    }
    return line_y - y;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

size_t utf8_prev(const std::string& s, size_t pos) {
    if (pos == 0) return 0;
    pos = std::min(pos, s.size());
    --pos;
    while (pos > 0 && is_continuation(static_cast<unsigned char>(s[pos]))) --pos;
    return pos;
}

size_t utf8_next(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    ++pos;
    while (pos < s.size() && is_continuation(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

std::string utf8_prefix(const std::string& s, size_t count) {
    size_t pos = 0;
    for (size_t i = 0; i < count && pos < s.size(); ++i) pos = utf8_next(s, pos);
    return s.substr(0, pos);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

}
