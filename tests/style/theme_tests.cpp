#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "style/styles.hpp"
#include "style/theme_manager.hpp"
#include "../test_support.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace wk_test;

TEST_CASE("Built-in themes carry the stock palette") {
    reset_environment();
    ThemeManager& tm = ThemeManager::instance();
    CHECK(tm.current_theme() == "light");
    CHECK(tm.color_hex("primary") == "#007ACC");
    CHECK(tm.color_hex("background") == "#FFFFFF");
    CHECK(tm.color_hex("no_such_color") == "#000000");
    CHECK_FALSE(tm.is_dark());

    REQUIRE(tm.set_theme("dark"));
    CHECK(tm.color_hex("primary") == "#0D7377");
    CHECK(tm.color_hex("surface") == "#2D2D2D");
    CHECK(tm.is_dark());

    const auto names = tm.available_themes();
    CHECK(std::find(names.begin(), names.end(), "light") != names.end());
    CHECK(std::find(names.begin(), names.end(), "dark") != names.end());
}

TEST_CASE("Spacing, radius and font roles fall back for unknown keys") {
    reset_environment();
    ThemeManager& tm = ThemeManager::instance();
    CHECK(tm.spacing("md") == 16);
    CHECK(tm.spacing("xl") == 32);
    CHECK(tm.spacing("huge") == 8);
    CHECK(tm.border_radius("lg") == 12);
    CHECK(tm.border_radius("weird") == 4);

    CHECK(tm.font("default").font_size == 12);
    CHECK(tm.font("heading").font_size == 16);
    CHECK(tm.font("heading").bold);
    CHECK(tm.font("caption").font_size == 10);
    CHECK(tm.font("missing").font_size == tm.font("default").font_size);

    tm.set_font_path("/tmp/custom.ttf");
    CHECK(tm.font("default").font_path == "/tmp/custom.ttf");
}

TEST_CASE("Theme switches notify listeners and unknown names are ignored") {
    reset_environment();
    ThemeManager& tm = ThemeManager::instance();
    std::vector<std::string> seen;
    const int id = tm.add_listener([&](const std::string& name) { seen.push_back(name); });

    CHECK_FALSE(tm.set_theme("nope"));
    CHECK(seen.empty());
    CHECK(tm.set_theme("dark"));
    CHECK(tm.set_theme("light"));
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "dark");
    CHECK(seen[1] == "light");

    tm.remove_listener(id);
    tm.set_theme("dark");
    CHECK(seen.size() == 2);
}

TEST_CASE("Theme files round trip and inherit missing keys") {
    reset_environment();
    ThemeManager& tm = ThemeManager::instance();
    const std::string path = "widgetkit_theme_test.json";
    {
        std::ofstream out(path);
        out << R"({"name": "solarized", "colors": {"primary": "#268BD2", "background": "#FDF6E3"},
                   "fonts": {"heading": {"size": 14, "bold": true}}, "spacing": {"md": 20}})";
    }
    REQUIRE(tm.load_theme_file(path));
    REQUIRE(tm.set_theme("solarized"));
    CHECK(tm.color_hex("primary") == "#268BD2");
    CHECK(tm.color_hex("danger") == "#DC3545");
    CHECK(tm.spacing("md") == 20);
    CHECK(tm.spacing("sm") == 8);

    const std::string saved = "widgetkit_theme_saved.json";
    REQUIRE(tm.save_theme_file("solarized", saved));
    tm.reset();
    CHECK(tm.find_theme("solarized") == nullptr);
    REQUIRE(tm.load_theme_file(saved));
    REQUIRE(tm.set_theme("solarized"));
    CHECK(tm.color_hex("background") == "#FDF6E3");

    CHECK_FALSE(tm.load_theme_file("does/not/exist.json"));
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_FALSE(tm.load_theme_file(path));
    CHECK_FALSE(tm.save_theme_file("unknown", saved));
    std::remove(path.c_str());
    std::remove(saved.c_str());
}

TEST_CASE("Color helpers parse and format hex") {
    const SDL_Color c = wk::parse_hex("#10203040");
    CHECK(c.r == 0x10);
    CHECK(c.a == 0x40);
    CHECK(wk::to_hex(wk::parse_hex("#abcdef")) == "#ABCDEF");
    CHECK(wk::same_color(wk::parse_hex("bogus", wk::rgba(1, 2, 3)), wk::rgba(1, 2, 3)));
    const SDL_Color m = wk::mix(wk::rgba(0, 0, 0), wk::rgba(200, 100, 50), 0.5f);
    CHECK(m.r == 100);
    CHECK(m.g == 50);
    CHECK(wk::lighten(wk::rgba(100, 100, 100), 1.0f).r == 255);
    CHECK(wk::darken(wk::rgba(100, 100, 100), 1.0f).r == 0);
}

TEST_CASE("Button styles follow the variant table") {
    reset_environment();
    const ButtonStyle destructive = Styles::Button(ButtonVariant::Destructive);
    CHECK(wk::to_hex(destructive.hover_bg) == "#C82333");
    CHECK(wk::to_hex(destructive.press_bg) == "#BD2130");
    const ButtonStyle primary = Styles::Button(ButtonVariant::Primary);
    CHECK(wk::same_color(primary.bg, ThemeManager::instance().color("primary")));
    const ButtonStyle ghost = Styles::Button(ButtonVariant::Ghost);
    CHECK(ghost.bg.a == 0);
    CHECK(Styles::Button(ButtonVariant::Primary, ButtonSize::Small).label.font_size <
          Styles::Button(ButtonVariant::Primary, ButtonSize::Large).label.font_size);
    CHECK(Styles::Status("error").fg.r == Styles::Status("danger").fg.r);
}
