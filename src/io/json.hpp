#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel::json
{

// Minimal JSON document model for config files (no external dependency).
// Objects keep insertion order; duplicate keys resolve to the first entry.
class Value
{
   public:
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    Value() = default;
    Value(bool b) : type_(Type::Bool), bool_(b) {}
    Value(double n) : type_(Type::Number), number_(n) {}
    Value(float n) : type_(Type::Number), number_(n) {}
    Value(int n) : type_(Type::Number), number_(n) {}
    Value(size_t n) : type_(Type::Number), number_(static_cast<double>(n)) {}
    Value(const char* s) : type_(Type::String), string_(s) {}
    Value(std::string s) : type_(Type::String), string_(std::move(s)) {}
    Value(std::string_view s) : type_(Type::String), string_(s) {}

    static Value array();
    static Value object();

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    // Typed reads with a default for missing or mistyped values. as_float
    // also falls back for numbers outside the float range.
    bool               as_bool(bool fallback = false) const;
    double             as_number(double fallback = 0.0) const;
    float              as_float(float fallback = 0.0f) const;
    const std::string& as_string() const;
    std::string        as_string(std::string_view fallback) const;

    // Arrays
    size_t       size() const { return items_.size(); }
    const Value& at(size_t i) const;
    Value&       push_back(Value v);
    const std::vector<Value>& items() const { return items_; }

    // Objects
    const Value* find(std::string_view key) const;
    Value&       set(std::string_view key, Value v);
    const std::vector<std::string>& keys() const { return keys_; }

    // Member lookups with defaults
    bool        get_bool(std::string_view key, bool fallback) const;
    float       get_float(std::string_view key, float fallback) const;
    double      get_number(std::string_view key, double fallback) const;
    std::string get_string(std::string_view key, std::string_view fallback) const;

   private:
    Type                     type_   = Type::Null;
    bool                     bool_   = false;
    double                   number_ = 0.0;
    std::string              string_;
    std::vector<Value>       items_;   // array elements or object values
    std::vector<std::string> keys_;    // object keys, parallel to items_
};

struct ParseError
{
    size_t      offset = 0;
    std::string message;
};

// Returns nullopt on malformed input; `error` receives the location
std::optional<Value> parse(std::string_view text, ParseError* error = nullptr);

std::string write(const Value& value, int indent = 2);

std::string escape(std::string_view s);

}   // namespace combopanel::json
