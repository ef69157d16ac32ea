#include "json.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

namespace combopanel::json
{

// ─── Value ──────────────────────────────────────────────────────────────────

Value Value::array()
{
    Value v;
    v.type_ = Type::Array;
    return v;
}

Value Value::object()
{
    Value v;
    v.type_ = Type::Object;
    return v;
}

bool Value::as_bool(bool fallback) const
{
    return type_ == Type::Bool ? bool_ : fallback;
}

double Value::as_number(double fallback) const
{
    return type_ == Type::Number ? number_ : fallback;
}

float Value::as_float(float fallback) const
{
    if (type_ != Type::Number || std::fabs(number_) > std::numeric_limits<float>::max())
        return fallback;
    return static_cast<float>(number_);
}

const std::string& Value::as_string() const
{
    return string_;
}

std::string Value::as_string(std::string_view fallback) const
{
    return type_ == Type::String ? string_ : std::string(fallback);
}

const Value& Value::at(size_t i) const
{
    static const Value null_value;
    return i < items_.size() ? items_[i] : null_value;
}

Value& Value::push_back(Value v)
{
    if (type_ != Type::Array)
    {
        *this = array();
    }
    items_.push_back(std::move(v));
    return items_.back();
}

const Value* Value::find(std::string_view key) const
{
    if (type_ != Type::Object)
        return nullptr;
    for (size_t i = 0; i < keys_.size(); ++i)
    {
        if (keys_[i] == key)
            return &items_[i];
    }
    return nullptr;
}

Value& Value::set(std::string_view key, Value v)
{
    if (type_ != Type::Object)
    {
        *this = object();
    }
    for (size_t i = 0; i < keys_.size(); ++i)
    {
        if (keys_[i] == key)
        {
            items_[i] = std::move(v);
            return items_[i];
        }
    }
    keys_.emplace_back(key);
    items_.push_back(std::move(v));
    return items_.back();
}

bool Value::get_bool(std::string_view key, bool fallback) const
{
    const Value* v = find(key);
    return v ? v->as_bool(fallback) : fallback;
}

float Value::get_float(std::string_view key, float fallback) const
{
    const Value* v = find(key);
    return v ? v->as_float(fallback) : fallback;
}

double Value::get_number(std::string_view key, double fallback) const
{
    const Value* v = find(key);
    return v ? v->as_number(fallback) : fallback;
}

std::string Value::get_string(std::string_view key, std::string_view fallback) const
{
    const Value* v = find(key);
    return v ? v->as_string(fallback) : std::string(fallback);
}

// ─── Parser ─────────────────────────────────────────────────────────────────

namespace
{

constexpr int MAX_DEPTH = 64;

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::optional<Value> parse_document(ParseError* error)
    {
        auto value = parse_value(0);
        if (value)
        {
            skip_ws();
            if (pos_ != text_.size())
            {
                fail("trailing characters");
                value.reset();
            }
        }
        if (!value && error)
            *error = ParseError{pos_, error_};
        return value;
    }

   private:
    std::string_view text_;
    size_t           pos_ = 0;
    std::string      error_;

    void fail(const char* message)
    {
        if (error_.empty())
            error_ = message;
    }

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                   || text_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(char c)
    {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view lit)
    {
        if (text_.substr(pos_, lit.size()) == lit)
        {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    std::optional<Value> parse_value(int depth)
    {
        if (depth > MAX_DEPTH)
        {
            fail("nesting too deep");
            return std::nullopt;
        }

        skip_ws();
        if (pos_ >= text_.size())
        {
            fail("unexpected end of input");
            return std::nullopt;
        }

        char c = text_[pos_];
        if (c == '{')
            return parse_object(depth);
        if (c == '[')
            return parse_array(depth);
        if (c == '"')
        {
            auto s = parse_string();
            if (!s)
                return std::nullopt;
            return Value(std::move(*s));
        }
        if (consume_literal("true"))
            return Value(true);
        if (consume_literal("false"))
            return Value(false);
        if (consume_literal("null"))
            return Value();
        return parse_number();
    }

    std::optional<Value> parse_number()
    {
        const char* begin = text_.data() + pos_;
        const char* end   = text_.data() + text_.size();
        double      v     = 0.0;
        auto [ptr, ec]    = std::from_chars(begin, end, v);
        if (ec != std::errc() || ptr == begin || !std::isfinite(v))
        {
            fail("invalid number");
            return std::nullopt;
        }
        pos_ += static_cast<size_t>(ptr - begin);
        return Value(v);
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<std::string> parse_string()
    {
        if (!consume('"'))
        {
            fail("expected string");
            return std::nullopt;
        }

        std::string out;
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return out;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                break;

            char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                case '\\':
                case '/':
                    out += esc;
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    if (pos_ + 4 > text_.size())
                    {
                        fail("truncated unicode escape");
                        return std::nullopt;
                    }
                    unsigned cp = 0;
                    auto [ptr, ec] =
                        std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, cp, 16);
                    if (ec != std::errc() || ptr != text_.data() + pos_ + 4)
                    {
                        fail("invalid unicode escape");
                        return std::nullopt;
                    }
                    pos_ += 4;
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("invalid escape");
                    return std::nullopt;
            }
        }

        fail("unterminated string");
        return std::nullopt;
    }

    std::optional<Value> parse_array(int depth)
    {
        consume('[');
        Value arr = Value::array();
        if (consume(']'))
            return arr;

        while (true)
        {
            auto item = parse_value(depth + 1);
            if (!item)
                return std::nullopt;
            arr.push_back(std::move(*item));

            if (consume(','))
                continue;
            if (consume(']'))
                return arr;
            fail("expected ',' or ']'");
            return std::nullopt;
        }
    }

    std::optional<Value> parse_object(int depth)
    {
        consume('{');
        Value obj = Value::object();
        if (consume('}'))
            return obj;

        while (true)
        {
            skip_ws();
            auto key = parse_string();
            if (!key)
                return std::nullopt;
            if (!consume(':'))
            {
                fail("expected ':'");
                return std::nullopt;
            }
            auto value = parse_value(depth + 1);
            if (!value)
                return std::nullopt;
            if (!obj.find(*key))
                obj.set(*key, std::move(*value));

            if (consume(','))
                continue;
            if (consume('}'))
                return obj;
            fail("expected ',' or '}'");
            return std::nullopt;
        }
    }
};

// ─── Writer ─────────────────────────────────────────────────────────────────

std::string format_number(double v)
{
    if (!std::isfinite(v))
        return "0";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    return buf;
}

void write_value(std::ostringstream& os, const Value& v, int indent, int level)
{
    auto newline = [&](int lvl)
    {
        if (indent <= 0)
            return;
        os << '\n' << std::string(static_cast<size_t>(lvl * indent), ' ');
    };

    switch (v.type())
    {
        case Value::Type::Null:
            os << "null";
            break;
        case Value::Type::Bool:
            os << (v.as_bool() ? "true" : "false");
            break;
        case Value::Type::Number:
            os << format_number(v.as_number());
            break;
        case Value::Type::String:
            os << '"' << escape(v.as_string()) << '"';
            break;
        case Value::Type::Array:
        {
            if (v.size() == 0)
            {
                os << "[]";
                break;
            }
            // Arrays of scalars stay on one line
            bool flat = true;
            for (const auto& item : v.items())
                flat = flat && !item.is_array() && !item.is_object();

            os << '[';
            for (size_t i = 0; i < v.size(); ++i)
            {
                if (i > 0)
                    os << (flat ? ", " : ",");
                if (!flat)
                    newline(level + 1);
                write_value(os, v.at(i), indent, level + 1);
            }
            if (!flat)
                newline(level);
            os << ']';
            break;
        }
        case Value::Type::Object:
        {
            if (v.keys().empty())
            {
                os << "{}";
                break;
            }
            os << '{';
            for (size_t i = 0; i < v.keys().size(); ++i)
            {
                if (i > 0)
                    os << ',';
                newline(level + 1);
                os << '"' << escape(v.keys()[i]) << "\":" << (indent > 0 ? " " : "");
                write_value(os, v.items()[i], indent, level + 1);
            }
            newline(level);
            os << '}';
            break;
        }
    }
}

}   // namespace

std::optional<Value> parse(std::string_view text, ParseError* error)
{
    Parser parser(text);
    return parser.parse_document(error);
}

std::string write(const Value& value, int indent)
{
    std::ostringstream os;
    write_value(os, value, indent, 0);
    return os.str();
}

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

}   // namespace combopanel::json
