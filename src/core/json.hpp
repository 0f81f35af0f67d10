#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace termdeck
{

// Minimal JSON document model for the preference and workspace files.
// No external dependency; handles everything those files contain (objects,
// arrays, strings with escapes, numbers, bools, null). Object key order is
// preserved so rewritten files diff cleanly.
class JsonValue
{
   public:
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    using Array  = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : type_(Type::Bool), bool_(b) {}
    JsonValue(int n) : type_(Type::Number), number_(n) {}
    JsonValue(uint32_t n) : type_(Type::Number), number_(n) {}
    JsonValue(double n) : type_(Type::Number), number_(n) {}
    JsonValue(float n) : type_(Type::Number), number_(n) {}
    JsonValue(const char* s) : type_(Type::String), string_(s ? s : "") {}
    JsonValue(std::string s) : type_(Type::String), string_(std::move(s)) {}
    JsonValue(std::string_view s) : type_(Type::String), string_(s) {}

    static JsonValue array(Array items = {});
    static JsonValue object(Object members = {});
    static JsonValue string_list(const std::vector<std::string>& items);

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool               as_bool() const { return bool_; }
    double             as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const Array&       as_array() const { return array_; }
    const Object&      as_object() const { return object_; }

    // Array helpers
    void push_back(JsonValue v);

    // Object helpers. set() replaces an existing key in place.
    void             set(std::string_view key, JsonValue v);
    const JsonValue* find(std::string_view key) const;
    bool             erase(std::string_view key);

    // Typed member reads with fallbacks (missing key or wrong type).
    std::string string_or(std::string_view key, std::string_view fallback = {}) const;
    double      number_or(std::string_view key, double fallback) const;
    bool        bool_or(std::string_view key, bool fallback) const;
    std::optional<std::vector<std::string>> string_list_at(std::string_view key) const;

    // Serialize. indent < 0 writes compact single-line output; indented
    // output is file-ready and ends with a newline.
    std::string dump(int indent = 2) const;

    // Parse a complete document. Returns nullopt on any syntax error or
    // trailing garbage.
    static std::optional<JsonValue> parse(std::string_view text);

   private:
    Type        type_   = Type::Null;
    bool        bool_   = false;
    double      number_ = 0.0;
    std::string string_;
    Array       array_;
    Object      object_;

    void dump_to(std::string& out, int indent, int depth) const;
};

std::string escape_json(std::string_view s);

}   // namespace termdeck
