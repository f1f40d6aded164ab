#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class PropertyCategoryHeader;
class PropertyRow;
class ScrollArea;

enum class PropertyType { Auto, String, Int, Float, Bool, Choice, Color };

namespace wk {
// "string", "int", "float", "bool", "choice", "color"; unknown maps to Auto.
PropertyType parse_property_type(const std::string& s);
const char* property_type_name(PropertyType t);
}

// Name/value editor grouped by category. Each value gets the editor of its
// type: a text box for strings and numbers, a check box for bools, a
// dropdown for choices and a hex text box with a swatch for colors.
//
// Values are JSON: bool, integer, float, or string ("#RRGGBB" for colors).
class PropertyGrid : public Widget {
public:
    static constexpr int kIntLimit = 999999;

    explicit PropertyGrid(const std::string& title = "Properties");
    ~PropertyGrid() override;

    // Auto picks the type from the value. Properties without a category
    // are listed first, without a header. Returns false for a duplicate
    // name or a value the type cannot hold.
    bool add_property(const std::string& name, const nlohmann::json& value, PropertyType type = PropertyType::Auto,
                      const std::string& category = {}, const std::vector<std::string>& options = {},
                      bool read_only = false);
    bool remove_property(const std::string& name);
    void clear_properties();
    bool has_property(const std::string& name) const;
    std::vector<std::string> property_names() const;
    PropertyType property_type(const std::string& name) const;
    std::string property_category(const std::string& name) const;

    // null for an unknown name.
    nlohmann::json get_property(const std::string& name) const;
    // Updates the value and its editor without emitting property_changed.
    // Numbers are converted to the property's type.
    bool set_property(const std::string& name, const nlohmann::json& value);
    // Applies a value as if the user edited it.
    bool edit_property(const std::string& name, const nlohmann::json& value);

    // {name: value}
    nlohmann::json properties() const;
    // Replaces every property, detecting types.
    void set_properties(const nlohmann::json& values);
    // Restores the values the properties were added with.
    void reset_properties();

    std::vector<std::string> categories() const;
    void set_category_expanded(const std::string& category, bool expanded);
    bool is_category_expanded(const std::string& category) const;

    // Editor widget of the property, for tests and custom styling.
    Widget* editor(const std::string& name) const;
    BaseButton* reset_button() const { return reset_button_; }

    void set_on_property_changed(std::function<void(const std::string&, const nlohmann::json&)> cb) {
        on_property_changed_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    friend class PropertyRow;

    struct Property {
        std::string name;
        PropertyType type = PropertyType::String;
        nlohmann::json value;
        nlohmann::json initial;
        std::vector<std::string> options;
        bool read_only = false;
        std::string category;
        PropertyRow* row = nullptr;
    };
    struct Category {
        std::string title;
        bool expanded = true;
        PropertyCategoryHeader* header = nullptr;
        BoxLayout* rows = nullptr;
    };

    Property* find(const std::string& name);
    const Property* find(const std::string& name) const;
    Category* find_category(const std::string& title);
    const Category* find_category(const std::string& title) const;
    Category& ensure_category(const std::string& title);
    // Converts to the type's JSON form; false when it does not fit.
    bool coerce(PropertyType type, const std::vector<std::string>& options, const nlohmann::json& in,
                nlohmann::json& out) const;
    void user_changed(const std::string& name, const nlohmann::json& value);

    std::unique_ptr<BoxLayout> layout_;
    ScrollArea* scroll_ = nullptr;
    BoxLayout* body_ = nullptr;
    BaseButton* reset_button_ = nullptr;
    std::vector<Property> props_;
    std::vector<Category> categories_;
    std::function<void(const std::string&, const nlohmann::json&)> on_property_changed_{};
};
