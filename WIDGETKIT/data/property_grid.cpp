#include "property_grid.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kRowMinHeight = 36;
constexpr int kRowPad = 12;
constexpr int kHeaderHeight = 32;
constexpr int kSwatchSize = 20;
constexpr float kNameFraction = 0.4f;
constexpr float kDisabledAlpha = 0.5f;

bool is_hex_color(const std::string& s) {
    if (s.size() != 7 && s.size() != 9) return false;
    if (s[0] != '#') return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

bool parse_long(const std::string& s, long long& out) {
    const std::string t = wk_text::trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    out = std::strtoll(t.c_str(), &end, 10);
    return end == t.c_str() + t.size();
}

bool parse_double(const std::string& s, double& out) {
    const std::string t = wk_text::trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    out = std::strtod(t.c_str(), &end);
    return end == t.c_str() + t.size() && std::isfinite(out);
}

std::string display_text(PropertyType type, const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (type == PropertyType::Float && v.is_number()) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.3f", v.get<double>());
        return buf;
    }
    if (v.is_null()) return {};
    return v.dump();
}
}

namespace wk {
PropertyType parse_property_type(const std::string& s) {
    const std::string t = wk_text::to_lower(s);
    if (t == "string") return PropertyType::String;
    if (t == "int") return PropertyType::Int;
    if (t == "float") return PropertyType::Float;
    if (t == "bool") return PropertyType::Bool;
    if (t == "choice") return PropertyType::Choice;
    if (t == "color") return PropertyType::Color;
    return PropertyType::Auto;
}

const char* property_type_name(PropertyType t) {
    switch (t) {
    case PropertyType::String: return "string";
    case PropertyType::Int: return "int";
    case PropertyType::Float: return "float";
    case PropertyType::Bool: return "bool";
    case PropertyType::Choice: return "choice";
    case PropertyType::Color: return "color";
    default: return "auto";
    }
}
}

// Clickable category title; toggles the rows below it.
class PropertyCategoryHeader : public Widget {
public:
    PropertyCategoryHeader(PropertyGrid& grid, const std::string& title) : grid_(grid), title_(title) {}

    void set_expanded(bool e) { expanded_ = e; }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : 160; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : kHeaderHeight; }

    bool handle_event(const SDL_Event& e) override {
        if (!visible_ || !enabled_) return false;
        track_hover(e);
        const ClickTracker::Result res = click_.feed(e, rect_);
        if (res == ClickTracker::Result::Clicked) {
            grid_.set_category_expanded(title_, !expanded_);
            return true;
        }
        return res != ClickTracker::Result::None;
    }

    void render(SDL_Renderer* r) const override {
        if (!visible_) return;
        const auto& tm = ThemeManager::instance();
        const float alpha = effective_opacity();
        wk_draw::fill_rect(r, rect_, hovered_ ? tm.color("hover") : tm.color("light"), alpha);
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);
        const SDL_Rect chevron{ rect_.x + kRowPad, rect_.y + (rect_.h - 12) / 2, 12, 12 };
        wk_draw::draw_chevron(r, chevron, expanded_ ? wk_draw::Direction::Down : wk_draw::Direction::Right,
                              tm.color("text_secondary"), alpha);
        LabelStyle st = Styles::Label("default", "text");
        st.bold = true;
        const SDL_Rect text_area{ chevron.x + 20, rect_.y, std::max(0, rect_.w - kRowPad - 20 - kRowPad), rect_.h };
        wk_text::draw_in_rect(r, st, wk_text::elide(st, title_, text_area.w), text_area, wk_text::Align::Left, alpha);
    }

private:
    PropertyGrid& grid_;
    std::string title_;
    bool expanded_ = true;
    ClickTracker click_;
};

// Name on the left, the type's editor on the right.
class PropertyRow : public Widget {
public:
    PropertyRow(PropertyGrid& grid, const std::string& name, PropertyType type, const nlohmann::json& value,
                const std::vector<std::string>& options, bool read_only)
        : grid_(grid), name_(name), type_(type), value_(value) {
        if (read_only) {
            auto label = std::make_unique<Label>(display_text(type, value), "default", "text_secondary");
            label_ = label.get();
            editor_ = std::move(label);
        } else if (type == PropertyType::Bool) {
            auto check = std::make_unique<Checkbox>("", value.get<bool>());
            check_ = check.get();
            check_->set_on_toggled([this](bool on) {
                if (!syncing_) grid_.user_changed(name_, on);
            });
            editor_ = std::move(check);
        } else if (type == PropertyType::Choice) {
            const std::string current = value.get<std::string>();
            auto it = std::find(options.begin(), options.end(), current);
            const int idx = it == options.end() ? 0 : static_cast<int>(it - options.begin());
            auto choice = std::make_unique<Dropdown>(options, idx);
            choice_ = choice.get();
            choice_->set_on_changed([this](int, const std::string& text) {
                if (!syncing_) grid_.user_changed(name_, text);
            });
            editor_ = std::move(choice);
        } else {
            auto text = std::make_unique<TextBox>(display_text(type, value));
            text_ = text.get();
            text_->set_on_text_changed([this](const std::string& s) { text_edited(s); });
            text_->set_on_focus_changed([this](bool focused) {
                if (!focused) show_value(value_);
            });
            editor_ = std::move(text);
        }
        editor_->set_parent(this);
    }

    Widget* editor() const { return editor_.get(); }

    // Mirrors a value into the editor without reporting it back.
    void show_value(const nlohmann::json& v) {
        value_ = v;
        syncing_ = true;
        if (label_) label_->set_text(display_text(type_, v));
        if (check_) check_->set_checked(v.get<bool>());
        if (choice_) choice_->set_selected_text(v.get<std::string>());
        if (text_ && text_->text() != display_text(type_, v)) text_->set_text(display_text(type_, v));
        syncing_ = false;
    }

    void set_value(const nlohmann::json& v) { value_ = v; }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : 280; }

    int height_for_width(int w) const override {
        if (fixed_h_ >= 0) return fixed_h_;
        return std::max(kRowMinHeight, editor_->height_for_width(editor_width(w)) + 8);
    }

    bool handle_event(const SDL_Event& e) override {
        if (!visible_ || !enabled_) return false;
        track_hover(e);
        return editor_->handle_event(e);
    }

    void update() override { editor_->update(); }

    void render(SDL_Renderer* r) const override {
        if (!visible_) return;
        const auto& tm = ThemeManager::instance();
        const float alpha = effective_opacity();
        if (hovered_) wk_draw::fill_rect(r, rect_, wk::with_alpha(tm.color("hover"), 140), alpha);
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);
        const int name_w = name_width(rect_.w);
        const LabelStyle st = Styles::Label("default", "text");
        const SDL_Rect name_area{ rect_.x + kRowPad, rect_.y, std::max(0, name_w - 2 * kRowPad), rect_.h };
        wk_text::draw_in_rect(r, st, wk_text::elide(st, name_, name_area.w), name_area, wk_text::Align::Left, alpha);
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x + name_w, rect_.y, 1, rect_.h }, tm.color("border"), alpha);
        if (type_ == PropertyType::Color) {
            const SDL_Rect editor_rect = editor_->rect();
            const SDL_Rect swatch{ editor_rect.x + editor_rect.w + 6, rect_.y + (rect_.h - kSwatchSize) / 2, kSwatchSize,
                                   kSwatchSize };
            const SDL_Color c = wk::parse_hex(value_.is_string() ? value_.get<std::string>() : std::string("#000000"));
            wk_draw::fill_rounded_rect(r, swatch, tm.border_radius("sm"), c, alpha);
            wk_draw::draw_rounded_rect(r, swatch, tm.border_radius("sm"), tm.color("border"), alpha);
        }
        editor_->render(r);
    }

protected:
    void layout() override {
        const int name_w = name_width(rect_.w);
        const int w = editor_width(rect_.w);
        const int h = std::min(rect_.h - 4, editor_->height_for_width(w));
        editor_->set_rect(SDL_Rect{ rect_.x + name_w + 8, rect_.y + (rect_.h - h) / 2, w, h });
    }

private:
    static int name_width(int w) { return static_cast<int>(static_cast<float>(w) * kNameFraction); }

    int editor_width(int w) const {
        const int swatch = type_ == PropertyType::Color ? kSwatchSize + 6 : 0;
        return std::max(40, w - name_width(w) - 8 - kRowPad - swatch);
    }

    void text_edited(const std::string& s) {
        if (syncing_) return;
        nlohmann::json v;
        if (type_ == PropertyType::Int) {
            long long n = 0;
            if (!parse_long(s, n)) return;
            v = std::max<long long>(-PropertyGrid::kIntLimit, std::min<long long>(PropertyGrid::kIntLimit, n));
        } else if (type_ == PropertyType::Float) {
            double d = 0.0;
            if (!parse_double(s, d)) return;
            v = d;
        } else if (type_ == PropertyType::Color) {
            const std::string t = wk_text::trim(s);
            if (!is_hex_color(t)) return;
            v = wk::to_hex(wk::parse_hex(t));
        } else {
            v = s;
        }
        value_ = v;
        grid_.user_changed(name_, v);
    }

    PropertyGrid& grid_;
    std::string name_;
    PropertyType type_;
    nlohmann::json value_;
    std::unique_ptr<Widget> editor_;
    Label* label_ = nullptr;
    Checkbox* check_ = nullptr;
    Dropdown* choice_ = nullptr;
    TextBox* text_ = nullptr;
    bool syncing_ = false;
};

PropertyGrid::PropertyGrid(const std::string& title)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0)) {
    layout_->set_parent(this);
    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_margins(12, 8, 12, 8);
    header->set_alignment(BoxLayout::Align::Center);
    header->add_widget(std::make_unique<Label>(title, "heading", "text"), 1);
    reset_button_ = header->add_widget(std::make_unique<BaseButton>("Reset", ButtonVariant::Ghost, ButtonSize::Small));
    reset_button_->set_on_clicked([this]() { reset_properties(); });
    layout_->add_widget(std::move(header));
    layout_->add_widget(std::make_unique<Separator>());

    auto body = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    body_ = body.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(body)), 1);
}

PropertyGrid::~PropertyGrid() = default;

PropertyGrid::Property* PropertyGrid::find(const std::string& name) {
    for (auto& p : props_) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

const PropertyGrid::Property* PropertyGrid::find(const std::string& name) const {
    return const_cast<PropertyGrid*>(this)->find(name);
}

PropertyGrid::Category* PropertyGrid::find_category(const std::string& title) {
    for (auto& c : categories_) {
        if (c.title == title) return &c;
    }
    return nullptr;
}

const PropertyGrid::Category* PropertyGrid::find_category(const std::string& title) const {
    return const_cast<PropertyGrid*>(this)->find_category(title);
}

PropertyGrid::Category& PropertyGrid::ensure_category(const std::string& title) {
    if (Category* c = find_category(title)) return *c;
    Category c;
    c.title = title;
    auto rows = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    if (title.empty()) {
        c.rows = static_cast<BoxLayout*>(body_->insert(0, std::move(rows)));
        categories_.insert(categories_.begin(), c);
        return categories_.front();
    }
    c.header = body_->add_widget(std::make_unique<PropertyCategoryHeader>(*this, title));
    c.rows = body_->add_widget(std::move(rows));
    categories_.push_back(c);
    return categories_.back();
}

bool PropertyGrid::coerce(PropertyType type, const std::vector<std::string>& options, const nlohmann::json& in,
                          nlohmann::json& out) const {
    switch (type) {
    case PropertyType::String:
        if (in.is_structured()) return false;
        out = in.is_string() ? in.get<std::string>() : (in.is_null() ? std::string() : in.dump());
        return true;
    case PropertyType::Int: {
        long long n = 0;
        if (in.is_number_integer()) {
            n = in.get<long long>();
        } else if (in.is_number_float()) {
            n = std::llround(in.get<double>());
        } else if (!in.is_string() || !parse_long(in.get<std::string>(), n)) {
            return false;
        }
        out = std::max<long long>(-kIntLimit, std::min<long long>(kIntLimit, n));
        return true;
    }
    case PropertyType::Float: {
        double d = 0.0;
        if (in.is_number()) {
            d = in.get<double>();
        } else if (!in.is_string() || !parse_double(in.get<std::string>(), d)) {
            return false;
        }
        out = d;
        return true;
    }
    case PropertyType::Bool:
        if (!in.is_boolean()) return false;
        out = in;
        return true;
    case PropertyType::Choice:
        if (options.empty()) return false;
        if (in.is_string()) {
            if (std::find(options.begin(), options.end(), in.get<std::string>()) == options.end()) return false;
            out = in;
            return true;
        }
        if (in.is_number_integer()) {
            const long long idx = in.get<long long>();
            if (idx < 0 || idx >= static_cast<long long>(options.size())) return false;
            out = options[static_cast<size_t>(idx)];
            return true;
        }
        return false;
    case PropertyType::Color:
        if (!in.is_string() || !is_hex_color(wk_text::trim(in.get<std::string>()))) return false;
        out = wk::to_hex(wk::parse_hex(wk_text::trim(in.get<std::string>())));
        return true;
    default:
        return false;
    }
}

bool PropertyGrid::add_property(const std::string& name, const nlohmann::json& value, PropertyType type,
                                const std::string& category, const std::vector<std::string>& options,
                                bool read_only) {
    if (name.empty() || find(name)) return false;
    if (type == PropertyType::Auto) {
        if (value.is_boolean()) {
            type = PropertyType::Bool;
        } else if (value.is_number_integer()) {
            type = PropertyType::Int;
        } else if (value.is_number_float()) {
            type = PropertyType::Float;
        } else {
            type = PropertyType::String;
        }
    }
    nlohmann::json v;
    if (!coerce(type, options, value, v)) {
        std::cerr << "[PropertyGrid] Value for \"" << name << "\" does not fit type " << wk::property_type_name(type)
                  << "\n";
        return false;
    }
    Category& cat = ensure_category(category);
    Property p;
    p.name = name;
    p.type = type;
    p.value = v;
    p.initial = v;
    p.options = options;
    p.read_only = read_only;
    p.category = category;
    p.row = cat.rows->add_widget(std::make_unique<PropertyRow>(*this, name, type, v, options, read_only));
    props_.push_back(p);
    layout();
    return true;
}

bool PropertyGrid::remove_property(const std::string& name) {
    auto it = std::find_if(props_.begin(), props_.end(), [&name](const Property& p) { return p.name == name; });
    if (it == props_.end()) return false;
    const std::string category = it->category;
    Category* cat = find_category(category);
    if (cat) cat->rows->remove(it->row);
    props_.erase(it);
    const bool used = std::any_of(props_.begin(), props_.end(), [&category](const Property& p) { return p.category == category; });
    if (cat && !used) {
        if (cat->header) body_->remove(cat->header);
        body_->remove(cat->rows);
        categories_.erase(categories_.begin() + (cat - categories_.data()));
    }
    layout();
    return true;
}

void PropertyGrid::clear_properties() {
    props_.clear();
    categories_.clear();
    body_->clear();
    layout();
}

bool PropertyGrid::has_property(const std::string& name) const { return find(name) != nullptr; }

std::vector<std::string> PropertyGrid::property_names() const {
    std::vector<std::string> out;
    for (const auto& p : props_) out.push_back(p.name);
    return out;
}

PropertyType PropertyGrid::property_type(const std::string& name) const {
    const Property* p = find(name);
    return p ? p->type : PropertyType::Auto;
}

std::string PropertyGrid::property_category(const std::string& name) const {
    const Property* p = find(name);
    return p ? p->category : std::string();
}

nlohmann::json PropertyGrid::get_property(const std::string& name) const {
    const Property* p = find(name);
    return p ? p->value : nlohmann::json();
}

bool PropertyGrid::set_property(const std::string& name, const nlohmann::json& value) {
    Property* p = find(name);
    if (!p) return false;
    nlohmann::json v;
    if (!coerce(p->type, p->options, value, v)) return false;
    p->value = v;
    p->row->show_value(v);
    return true;
}

bool PropertyGrid::edit_property(const std::string& name, const nlohmann::json& value) {
    Property* p = find(name);
    if (!p || p->read_only) return false;
    nlohmann::json v;
    if (!coerce(p->type, p->options, value, v)) return false;
    p->row->show_value(v);
    user_changed(name, v);
    return true;
}

void PropertyGrid::user_changed(const std::string& name, const nlohmann::json& value) {
    Property* p = find(name);
    if (!p || p->value == value) return;
    p->value = value;
    p->row->set_value(value);
    if (on_property_changed_) on_property_changed_(name, value);
}

nlohmann::json PropertyGrid::properties() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& p : props_) out[p.name] = p.value;
    return out;
}

void PropertyGrid::set_properties(const nlohmann::json& values) {
    if (!values.is_object()) {
        std::cerr << "[PropertyGrid] Properties must be a JSON object\n";
        return;
    }
    clear_properties();
    for (auto it = values.begin(); it != values.end(); ++it) add_property(it.key(), it.value());
}

void PropertyGrid::reset_properties() {
    for (const auto& p : props_) {
        if (p.value == p.initial) continue;
        const std::string name = p.name;
        const nlohmann::json initial = p.initial;
        p.row->show_value(initial);
        user_changed(name, initial);
    }
}

std::vector<std::string> PropertyGrid::categories() const {
    std::vector<std::string> out;
    for (const auto& c : categories_) {
        if (!c.title.empty()) out.push_back(c.title);
    }
    return out;
}

void PropertyGrid::set_category_expanded(const std::string& category, bool expanded) {
    Category* c = find_category(category);
    if (!c || !c->header || c->expanded == expanded) return;
    c->expanded = expanded;
    c->header->set_expanded(expanded);
    c->rows->set_visible(expanded);
    layout();
}

bool PropertyGrid::is_category_expanded(const std::string& category) const {
    const Category* c = find_category(category);
    return c && c->expanded;
}

Widget* PropertyGrid::editor(const std::string& name) const {
    const Property* p = find(name);
    return p ? p->row->editor() : nullptr;
}

int PropertyGrid::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : std::max(300, layout_->preferred_width());
}

int PropertyGrid::height_for_width(int w) const {
    return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w);
}

void PropertyGrid::layout() { layout_->set_rect(rect_); }

bool PropertyGrid::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void PropertyGrid::update() { layout_->update(); }

void PropertyGrid::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = tm.border_radius("md");
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("surface"), alpha);
    {
        wk_draw::ClipScope clip(r, wk_draw::inset(rect_, 1, 1));
        layout_->render(r);
    }
    wk_draw::draw_rounded_rect(r, rect_, radius, tm.color("border"), alpha);
}
