#include "json.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace termdeck
{

// ─── Construction helpers ────────────────────────────────────────────────────

JsonValue JsonValue::array(Array items)
{
    JsonValue v;
    v.type_  = Type::Array;
    v.array_ = std::move(items);
    return v;
}

JsonValue JsonValue::object(Object members)
{
    JsonValue v;
    v.type_   = Type::Object;
    v.object_ = std::move(members);
    return v;
}

JsonValue JsonValue::string_list(const std::vector<std::string>& items)
{
    JsonValue v = array();
    v.array_.reserve(items.size());
    for (const auto& s : items)
        v.array_.emplace_back(s);
    return v;
}

void JsonValue::push_back(JsonValue v)
{
    if (type_ == Type::Null)
        type_ = Type::Array;
    if (type_ == Type::Array)
        array_.push_back(std::move(v));
}

void JsonValue::set(std::string_view key, JsonValue v)
{
    if (type_ == Type::Null)
        type_ = Type::Object;
    if (type_ != Type::Object)
        return;

    for (auto& member : object_)
    {
        if (member.first == key)
        {
            member.second = std::move(v);
            return;
        }
    }
    object_.emplace_back(std::string(key), std::move(v));
}

const JsonValue* JsonValue::find(std::string_view key) const
{
    if (type_ != Type::Object)
        return nullptr;
    for (const auto& member : object_)
    {
        if (member.first == key)
            return &member.second;
    }
    return nullptr;
}

bool JsonValue::erase(std::string_view key)
{
    if (type_ != Type::Object)
        return false;
    for (auto it = object_.begin(); it != object_.end(); ++it)
    {
        if (it->first == key)
        {
            object_.erase(it);
            return true;
        }
    }
    return false;
}

std::string JsonValue::string_or(std::string_view key, std::string_view fallback) const
{
    const JsonValue* v = find(key);
    return (v && v->is_string()) ? v->string_ : std::string(fallback);
}

double JsonValue::number_or(std::string_view key, double fallback) const
{
    const JsonValue* v = find(key);
    return (v && v->is_number()) ? v->number_ : fallback;
}

bool JsonValue::bool_or(std::string_view key, bool fallback) const
{
    const JsonValue* v = find(key);
    return (v && v->is_bool()) ? v->bool_ : fallback;
}

std::optional<std::vector<std::string>> JsonValue::string_list_at(std::string_view key) const
{
    const JsonValue* v = find(key);
    if (!v || !v->is_array())
        return std::nullopt;

    std::vector<std::string> out;
    out.reserve(v->array_.size());
    for (const auto& item : v->array_)
    {
        if (!item.is_string())
            return std::nullopt;
        out.push_back(item.string_);
    }
    return out;
}

// ─── Writer ──────────────────────────────────────────────────────────────────

std::string escape_json(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
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
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    std::ostringstream os;
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c));
                    out += os.str();
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

static void write_indent(std::string& out, int indent, int depth)
{
    if (indent < 0)
        return;
    out += '\n';
    out.append(static_cast<size_t>(indent * depth), ' ');
}

static std::string format_number(double n)
{
    if (!std::isfinite(n))
        return "0";
    if (n == std::floor(n) && std::fabs(n) < 1e15)
    {
        std::ostringstream os;
        os << static_cast<long long>(n);
        return os.str();
    }
    std::ostringstream os;
    os << std::setprecision(15) << n;
    return os.str();
}

void JsonValue::dump_to(std::string& out, int indent, int depth) const
{
    switch (type_)
    {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Type::Number:
            out += format_number(number_);
            break;
        case Type::String:
            out += '"';
            out += escape_json(string_);
            out += '"';
            break;
        case Type::Array:
            if (array_.empty())
            {
                out += "[]";
                break;
            }
            out += '[';
            for (size_t i = 0; i < array_.size(); ++i)
            {
                write_indent(out, indent, depth + 1);
                array_[i].dump_to(out, indent, depth + 1);
                if (i + 1 < array_.size())
                    out += ',';
            }
            write_indent(out, indent, depth);
            out += ']';
            break;
        case Type::Object:
            if (object_.empty())
            {
                out += "{}";
                break;
            }
            out += '{';
            for (size_t i = 0; i < object_.size(); ++i)
            {
                write_indent(out, indent, depth + 1);
                out += '"';
                out += escape_json(object_[i].first);
                out += indent < 0 ? "\":" : "\": ";
                object_[i].second.dump_to(out, indent, depth + 1);
                if (i + 1 < object_.size())
                    out += ',';
            }
            write_indent(out, indent, depth);
            out += '}';
            break;
    }
}

std::string JsonValue::dump(int indent) const
{
    std::string out;
    dump_to(out, indent, 0);
    if (indent >= 0)
        out += '\n';
    return out;
}

// ─── Reader ──────────────────────────────────────────────────────────────────

namespace
{

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::optional<JsonValue> parse_document()
    {
        auto value = parse_value(0);
        if (!value)
            return std::nullopt;
        skip_ws();
        if (pos_ != text_.size())
            return std::nullopt;
        return value;
    }

   private:
    static constexpr int MAX_DEPTH = 64;

    std::string_view text_;
    size_t           pos_ = 0;

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

    std::optional<JsonValue> parse_value(int depth)
    {
        if (depth > MAX_DEPTH)
            return std::nullopt;

        skip_ws();
        if (pos_ >= text_.size())
            return std::nullopt;

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
            return JsonValue(std::move(*s));
        }
        if (consume_literal("true"))
            return JsonValue(true);
        if (consume_literal("false"))
            return JsonValue(false);
        if (consume_literal("null"))
            return JsonValue(nullptr);
        return parse_number();
    }

    std::optional<JsonValue> parse_object(int depth)
    {
        ++pos_;   // '{'
        JsonValue obj = JsonValue::object();
        if (consume('}'))
            return obj;

        while (true)
        {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"')
                return std::nullopt;
            auto key = parse_string();
            if (!key || !consume(':'))
                return std::nullopt;
            auto value = parse_value(depth + 1);
            if (!value)
                return std::nullopt;
            obj.set(*key, std::move(*value));

            if (consume(','))
                continue;
            if (consume('}'))
                return obj;
            return std::nullopt;
        }
    }

    std::optional<JsonValue> parse_array(int depth)
    {
        ++pos_;   // '['
        JsonValue arr = JsonValue::array();
        if (consume(']'))
            return arr;

        while (true)
        {
            auto value = parse_value(depth + 1);
            if (!value)
                return std::nullopt;
            arr.push_back(std::move(*value));

            if (consume(','))
                continue;
            if (consume(']'))
                return arr;
            return std::nullopt;
        }
    }

    static void append_utf8(std::string& out, uint32_t cp)
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
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<uint32_t> parse_hex4()
    {
        if (pos_ + 4 > text_.size())
            return std::nullopt;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
        {
            char     c = text_[pos_++];
            uint32_t d;
            if (c >= '0' && c <= '9')
                d = static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f')
                d = static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                d = static_cast<uint32_t>(c - 'A' + 10);
            else
                return std::nullopt;
            v = (v << 4) | d;
        }
        return v;
    }

    std::optional<std::string> parse_string()
    {
        ++pos_;   // opening quote
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
                return std::nullopt;
            char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
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
                    auto cp = parse_hex4();
                    if (!cp)
                        return std::nullopt;
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF && consume_literal("\\u"))
                    {
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF)
                            return std::nullopt;
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;   // unterminated
    }

    std::optional<JsonValue> parse_number()
    {
        size_t start = pos_;
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+'))
            ++pos_;
        while (pos_ < text_.size()
               && ((text_[pos_] >= '0' && text_[pos_] <= '9') || text_[pos_] == '.'
                   || text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '-'
                   || text_[pos_] == '+'))
            ++pos_;
        if (pos_ == start)
            return std::nullopt;

        std::string token(text_.substr(start, pos_ - start));
        char*       end   = nullptr;
        double      value = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size())
            return std::nullopt;
        return JsonValue(value);
    }
};

}   // namespace

std::optional<JsonValue> JsonValue::parse(std::string_view text)
{
    Parser parser(text);
    return parser.parse_document();
}

}   // namespace termdeck
