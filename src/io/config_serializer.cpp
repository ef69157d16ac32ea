#include <algorithm>
#include <array>
#include <combopanel/config_serializer.hpp>
#include <combopanel/logger.hpp>
#include <fstream>
#include <iterator>
#include <span>

#include "core/slots.hpp"
#include "io/json.hpp"

namespace combopanel
{

namespace
{

using json::Value;

// ─── Enum names ─────────────────────────────────────────────────────────────

constexpr std::array<const char*, 2> ORIENTATION_NAMES{"vertical", "horizontal"};

Value name_to_json(size_t index, std::span<const char* const> names)
{
    if (names.empty())
        return Value("");
    return Value(index < names.size() ? names[index] : names[0]);
}

// Index of the name stored under `key`, nullopt when missing or unknown
std::optional<size_t> name_from_json(const Value&                 obj,
                                     std::string_view             key,
                                     std::span<const char* const> names)
{
    const Value* v = obj.find(key);
    if (!v || !v->is_string())
        return std::nullopt;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (v->as_string() == names[i])
            return i;
    }
    COMBOPANEL_LOG_WARN("config", "Unknown value '{}' for '{}'", v->as_string(), key);
    return std::nullopt;
}

template <typename E, size_t N>
Value enum_to_json(E value, const std::array<const char*, N>& names)
{
    return name_to_json(static_cast<size_t>(value), names);
}

template <typename E, size_t N>
E enum_from_json(const Value& obj, std::string_view key, const std::array<const char*, N>& names, E fallback)
{
    if (auto index = name_from_json(obj, key, names))
        return static_cast<E>(*index);
    return fallback;
}

// ─── Colors and fonts ───────────────────────────────────────────────────────

Value color_to_json(const Color& c)
{
    Value arr = Value::array();
    arr.push_back(c.r);
    arr.push_back(c.g);
    arr.push_back(c.b);
    arr.push_back(c.a);
    return arr;
}

// Accepts [r, g, b] or [r, g, b, a]
std::optional<Color> color_from_json(const Value* v)
{
    if (!v || !v->is_array() || v->size() < 3 || v->size() > 4)
        return std::nullopt;
    for (const auto& item : v->items())
    {
        if (!item.is_number())
            return std::nullopt;
    }
    return Color(v->at(0).as_float(),
                 v->at(1).as_float(),
                 v->at(2).as_float(),
                 v->size() == 4 ? v->at(3).as_float() : 1.0f);
}

Color read_color(const Value& obj, std::string_view key, const Color& fallback)
{
    return color_from_json(obj.find(key)).value_or(fallback);
}

Value color_source_to_json(const ColorSource& source)
{
    Value obj = Value::object();
    if (source.is_theme())
    {
        obj.set("type", "theme");
        obj.set("index", source.index);
        if (source.alpha_override)
            obj.set("alpha", *source.alpha_override);
    }
    else
    {
        obj.set("type", "custom");
        obj.set("color", color_to_json(source.color));
    }
    return obj;
}

ColorSource color_source_from_json(const Value* v, const ColorSource& fallback)
{
    if (!v)
        return fallback;

    // Plain colors from older documents
    if (auto plain = color_from_json(v))
        return ColorSource::custom(*plain);

    if (!v->is_object())
        return fallback;

    const std::string type = v->get_string("type", "custom");
    if (type == "theme")
    {
        std::optional<float> alpha;
        if (const Value* a = v->find("alpha"); a && a->is_number())
            alpha = a->as_float();
        return ColorSource::theme(static_cast<int>(v->get_number("index", 1.0)), alpha);
    }
    if (type == "custom")
    {
        if (auto c = color_from_json(v->find("color")))
            return ColorSource::custom(*c);
    }
    COMBOPANEL_LOG_WARN("config", "Invalid color source of type '{}'", type);
    return fallback;
}

Value font_spec_to_json(const FontSpec& font)
{
    Value obj = Value::object();
    obj.set("family", font.family);
    obj.set("size", font.size);
    return obj;
}

FontSpec font_spec_from_json(const Value* v, const FontSpec& fallback)
{
    if (!v || !v->is_object())
        return fallback;
    return FontSpec{v->get_string("family", fallback.family), v->get_float("size", fallback.size)};
}

Value font_source_to_json(const FontSource& source)
{
    Value obj = Value::object();
    if (source.is_theme())
    {
        obj.set("type", "theme");
        obj.set("index", source.index);
        if (source.size_override)
            obj.set("size", *source.size_override);
    }
    else
    {
        obj.set("type", "custom");
        obj.set("family", source.font.family);
        obj.set("size", source.font.size);
    }
    return obj;
}

// A bare {"family", "size"} object is a custom font
FontSource font_source_from_json(const Value* v, const FontSource& fallback)
{
    if (!v || !v->is_object())
        return fallback;

    if (v->get_string("type", "custom") == "theme")
    {
        std::optional<float> size;
        if (const Value* s = v->find("size"); s && s->is_number())
            size = s->as_float();
        return FontSource::theme(static_cast<int>(v->get_number("index", 1.0)), size);
    }

    const FontSpec font = font_spec_from_json(v, fallback.font);
    return FontSource::custom(font.family, font.size);
}

// ─── Theme ──────────────────────────────────────────────────────────────────

Value gradient_to_json(const Gradient& gradient)
{
    Value obj = Value::object();
    obj.set("angle", gradient.angle);
    Value stops = Value::array();
    for (const auto& stop : gradient.stops)
    {
        Value s = Value::object();
        s.set("position", stop.position);
        s.set("color", color_source_to_json(stop.color));
        stops.push_back(std::move(s));
    }
    obj.set("stops", std::move(stops));
    return obj;
}

Gradient gradient_from_json(const Value* v, const Gradient& fallback)
{
    if (!v || !v->is_object())
        return fallback;

    Gradient gradient;
    gradient.angle = v->get_float("angle", fallback.angle);

    const Value* stops = v->find("stops");
    if (!stops || !stops->is_array())
        return Gradient{fallback.stops, gradient.angle};

    for (const auto& s : stops->items())
    {
        if (!s.is_object())
            continue;
        GradientStop stop;
        stop.position = s.get_float("position", 0.0f);
        stop.color    = color_source_from_json(s.find("color"), ColorSource::custom(FALLBACK_COLOR));
        gradient.stops.push_back(stop);
    }
    return gradient;
}

Value theme_to_value(const Theme& theme)
{
    Value obj = Value::object();
    obj.set("name", theme.name);

    Value colors = Value::array();
    for (const auto& c : theme.colors)
        colors.push_back(color_to_json(c));
    obj.set("colors", std::move(colors));

    Value fonts = Value::array();
    for (const auto& f : theme.fonts)
        fonts.push_back(font_spec_to_json(f));
    obj.set("fonts", std::move(fonts));

    obj.set("gradient", gradient_to_json(theme.gradient));
    return obj;
}

// Entries missing from the document keep the values of `base`
Theme theme_from_value(const Value& obj, const Theme& base)
{
    Theme theme = base;
    theme.name  = obj.get_string("name", base.name);

    if (const Value* colors = obj.find("colors"); colors && colors->is_array())
    {
        const size_t n = std::min(colors->size(), THEME_COLOR_COUNT);
        for (size_t i = 0; i < n; ++i)
            theme.colors[i] = color_from_json(&colors->at(i)).value_or(base.colors[i]);
    }

    if (const Value* fonts = obj.find("fonts"); fonts && fonts->is_array())
    {
        const size_t n = std::min(fonts->size(), THEME_FONT_COUNT);
        for (size_t i = 0; i < n; ++i)
            theme.fonts[i] = font_spec_from_json(&fonts->at(i), base.fonts[i]);
    }

    theme.gradient = gradient_from_json(obj.find("gradient"), base.gradient);
    return theme;
}

// ─── Shared settings ────────────────────────────────────────────────────────

Value layout_to_json(const LayoutSettings& layout)
{
    Value obj = Value::object();
    obj.set("group_count", layout.group_count);

    Value counts = Value::array();
    for (size_t c : layout.group_item_counts)
        counts.push_back(c);
    obj.set("group_item_counts", std::move(counts));

    Value weights = Value::array();
    for (float w : layout.group_weights)
        weights.push_back(w);
    obj.set("group_weights", std::move(weights));

    Value orientations = Value::array();
    for (Orientation o : layout.group_item_orientations)
        orientations.push_back(enum_to_json(o, ORIENTATION_NAMES));
    obj.set("group_item_orientations", std::move(orientations));

    obj.set("split_orientation", enum_to_json(layout.split_orientation, ORIENTATION_NAMES));
    obj.set("content_padding", layout.content_padding);
    obj.set("item_spacing", layout.item_spacing);
    return obj;
}

// Counts are clamped to [0, max] before the cast to size_t
size_t count_from_json(double value, size_t max, std::string_view key)
{
    if (!(value > 0.0))
        return 0;
    if (value > static_cast<double>(max))
    {
        COMBOPANEL_LOG_WARN("config", "'{}' of {} exceeds the limit of {}", key, value, max);
        return max;
    }
    return static_cast<size_t>(value);
}

void layout_from_json(const Value& obj, LayoutSettings& layout)
{
    const double groups = obj.get_number("group_count", static_cast<double>(layout.group_count));
    layout.group_count  = count_from_json(groups, LayoutSettings::MAX_GROUPS, "group_count");

    // Per-group arrays never hold more than MAX_GROUPS entries
    if (const Value* counts = obj.find("group_item_counts"); counts && counts->is_array())
    {
        layout.group_item_counts.clear();
        for (const auto& c : counts->items())
        {
            if (layout.group_item_counts.size() == LayoutSettings::MAX_GROUPS)
                break;
            layout.group_item_counts.push_back(
                count_from_json(c.as_number(1.0), LayoutSettings::MAX_ITEMS_PER_GROUP, "group_item_counts"));
        }
    }

    if (const Value* weights = obj.find("group_weights"); weights && weights->is_array())
    {
        layout.group_weights.clear();
        for (const auto& w : weights->items())
        {
            if (layout.group_weights.size() == LayoutSettings::MAX_GROUPS)
                break;
            layout.group_weights.push_back(w.as_float(1.0f));
        }
    }

    if (const Value* orientations = obj.find("group_item_orientations");
        orientations && orientations->is_array())
    {
        layout.group_item_orientations.clear();
        for (const auto& o : orientations->items())
        {
            if (layout.group_item_orientations.size() == LayoutSettings::MAX_GROUPS)
                break;
            layout.group_item_orientations.push_back(o.as_string("vertical") == "horizontal"
                                                         ? Orientation::Horizontal
                                                         : Orientation::Vertical);
        }
    }

    layout.split_orientation =
        enum_from_json(obj, "split_orientation", ORIENTATION_NAMES, layout.split_orientation);
    layout.content_padding = obj.get_float("content_padding", layout.content_padding);
    layout.item_spacing    = obj.get_float("item_spacing", layout.item_spacing);
}

Value slots_to_json(const ContentSlots& slots)
{
    Value obj = Value::object();
    for (const auto& [name, item] : slots)
    {
        Value s = Value::object();
        s.set("display_as", display_type_name(item.display_as));
        s.set("item_height", item.item_height);
        s.set("auto_height", item.auto_height);

        Value props = Value::object();
        for (const auto& [key, value] : item.properties)
            props.set(key, value);
        s.set("properties", std::move(props));

        obj.set(name, std::move(s));
    }
    return obj;
}

ContentSlots slots_from_json(const Value& obj)
{
    ContentSlots slots;
    for (size_t i = 0; i < obj.keys().size(); ++i)
    {
        const std::string& name = obj.keys()[i];
        const Value&       s    = obj.items()[i];
        if (!parse_slot_name(name) || !s.is_object())
        {
            COMBOPANEL_LOG_WARN("config", "Ignoring invalid content slot '{}'", name);
            continue;
        }

        ContentItemConfig item;
        const std::string type = s.get_string("display_as", "bar");
        item.display_as        = display_type_from_name(type).value_or(ContentDisplayType::Bar);
        item.item_height       = s.get_float("item_height", item.item_height);
        item.auto_height       = s.get_bool("auto_height", item.auto_height);

        if (const Value* props = s.find("properties"); props && props->is_object())
        {
            for (size_t p = 0; p < props->keys().size(); ++p)
            {
                const Value& v = props->items()[p];
                if (v.is_string())
                    item.properties[props->keys()[p]] = v.as_string();
                else if (v.is_number())
                    item.properties[props->keys()[p]] = json::write(v, 0);
                else if (v.is_bool())
                    item.properties[props->keys()[p]] = v.as_bool() ? "true" : "false";
            }
        }
        slots.emplace(name, std::move(item));
    }
    return slots;
}

Value animation_to_json(const AnimationSettings& animation)
{
    Value obj = Value::object();
    obj.set("enabled", animation.enabled);
    obj.set("speed", animation.speed);
    return obj;
}

void animation_from_json(const Value& obj, AnimationSettings& animation)
{
    animation.enabled = obj.get_bool("enabled", animation.enabled);
    animation.speed   = obj.get_float("speed", animation.speed);
}

// ─── Skin decoration ────────────────────────────────────────────────────────

// Collects a skin's fields into a "skin_config" object
class SkinFieldWriter : public SkinFieldVisitor
{
   public:
    void field(std::string_view name, bool& value) override { obj_.set(name, value); }
    void field(std::string_view name, float& value) override { obj_.set(name, value); }
    void field(std::string_view name, std::string& value) override { obj_.set(name, value); }
    void field(std::string_view name, Color& value) override { obj_.set(name, color_to_json(value)); }

    void field(std::string_view name, ColorSource& value) override
    {
        obj_.set(name, color_source_to_json(value));
    }

    void field(std::string_view name, FontSource& value) override
    {
        obj_.set(name, font_source_to_json(value));
    }

    void choice(std::string_view name, size_t& index, std::span<const char* const> names) override
    {
        obj_.set(name, name_to_json(index, names));
    }

    Value take() { return std::move(obj_); }

   private:
    Value obj_ = Value::object();
};

// Applies a "skin_config" object; absent or mistyped entries keep the
// config's current values
class SkinFieldReader : public SkinFieldVisitor
{
   public:
    explicit SkinFieldReader(const Value& obj) : obj_(obj) {}

    void field(std::string_view name, bool& value) override { value = obj_.get_bool(name, value); }
    void field(std::string_view name, float& value) override { value = obj_.get_float(name, value); }
    void field(std::string_view name, std::string& value) override { value = obj_.get_string(name, value); }
    void field(std::string_view name, Color& value) override { value = read_color(obj_, name, value); }

    void field(std::string_view name, ColorSource& value) override
    {
        value = color_source_from_json(obj_.find(name), value);
    }

    void field(std::string_view name, FontSource& value) override
    {
        value = font_source_from_json(obj_.find(name), value);
    }

    void choice(std::string_view name, size_t& index, std::span<const char* const> names) override
    {
        if (auto found = name_from_json(obj_, name, names))
            index = *found;
    }

   private:
    const Value& obj_;
};

// ─── Files ──────────────────────────────────────────────────────────────────

bool write_file(const std::string& path, const std::string& text)
{
    std::ofstream f(path);
    if (!f.is_open())
    {
        COMBOPANEL_LOG_ERROR("config", "Cannot open '{}' for writing", path);
        return false;
    }
    f << text << '\n';
    return f.good();
}

std::optional<std::string> read_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        COMBOPANEL_LOG_WARN("config", "Cannot open '{}'", path);
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

std::optional<Value> parse_document(std::string_view text)
{
    json::ParseError error;
    auto             doc = json::parse(text, &error);
    if (!doc)
    {
        COMBOPANEL_LOG_WARN("config", "Malformed JSON at offset {}: {}", error.offset, error.message);
        return std::nullopt;
    }
    if (!doc->is_object())
    {
        COMBOPANEL_LOG_WARN("config", "Document root is not an object");
        return std::nullopt;
    }
    return doc;
}

}   // namespace

// ─── ConfigSerializer ───────────────────────────────────────────────────────

std::string ConfigSerializer::to_json(const FrameConfig& config)
{
    Value doc = Value::object();
    doc.set("version", VERSION);
    doc.set("skin", config.skin_id());
    doc.set("theme", theme_to_value(config.theme()));
    doc.set("layout", layout_to_json(config.layout()));
    doc.set("content_slots", slots_to_json(config.layout().content_slots));
    doc.set("animation", animation_to_json(config.animation()));

    // Visiting may normalize fields, so it runs on a copy
    SkinFieldWriter writer;
    config.clone()->visit_skin_fields(writer);
    doc.set("skin_config", writer.take());

    return json::write(doc);
}

std::unique_ptr<FrameConfig> ConfigSerializer::from_json(std::string_view    text,
                                                         const SkinRegistry& registry)
{
    auto doc = parse_document(text);
    if (!doc)
        return nullptr;

    const double version = doc->get_number("version", VERSION);
    if (version > VERSION)
    {
        COMBOPANEL_LOG_WARN("config", "Unsupported config version {}", version);
        return nullptr;
    }

    const std::string skin   = doc->get_string("skin", "");
    auto              config = registry.create_default_config(skin);
    if (!config)
        return nullptr;

    if (const Value* theme = doc->find("theme"); theme && theme->is_object())
        config->set_theme(theme_from_value(*theme, config->theme()));

    if (const Value* layout = doc->find("layout"); layout && layout->is_object())
        layout_from_json(*layout, config->layout());

    if (const Value* slots = doc->find("content_slots"); slots && slots->is_object())
        config->layout().content_slots = slots_from_json(*slots);

    if (const Value* animation = doc->find("animation"); animation && animation->is_object())
        animation_from_json(*animation, config->animation());

    if (const Value* skin_config = doc->find("skin_config"); skin_config && skin_config->is_object())
    {
        SkinFieldReader reader(*skin_config);
        config->visit_skin_fields(reader);
    }

    COMBOPANEL_LOG_DEBUG("config",
                         "Loaded '{}' config with {} groups",
                         skin,
                         config->layout().effective_group_count());
    return config;
}

bool ConfigSerializer::save(const std::string& path, const FrameConfig& config)
{
    return write_file(path, to_json(config));
}

std::unique_ptr<FrameConfig> ConfigSerializer::load(const std::string& path, const SkinRegistry& registry)
{
    auto text = read_file(path);
    if (!text)
        return nullptr;
    return from_json(*text, registry);
}

// ─── ThemeSerializer ────────────────────────────────────────────────────────

std::string ThemeSerializer::to_json(const Theme& theme)
{
    return json::write(theme_to_value(theme));
}

std::optional<Theme> ThemeSerializer::from_json(std::string_view text)
{
    auto doc = parse_document(text);
    if (!doc)
        return std::nullopt;

    if (doc->get_string("name", "").empty())
    {
        COMBOPANEL_LOG_WARN("theme", "Theme document has no name");
        return std::nullopt;
    }
    return theme_from_value(*doc, default_theme());
}

bool ThemeSerializer::save(const std::string& path, const Theme& theme)
{
    return write_file(path, to_json(theme));
}

std::optional<Theme> ThemeSerializer::load(const std::string& path)
{
    auto text = read_file(path);
    if (!text)
        return std::nullopt;
    return from_json(*text);
}

}   // namespace combopanel
