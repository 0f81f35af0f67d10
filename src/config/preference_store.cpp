#include "preference_store.hpp"

#include <termdeck/logger.hpp>

#include "core/json.hpp"
#include "core/paths.hpp"

#include <type_traits>

namespace termdeck
{

// ─── MemoryPreferenceStore ───────────────────────────────────────────────────

template <typename T, typename Map>
static std::optional<T> read_as(const Map& values, std::string_view key)
{
    auto it = values.find(key);
    if (it == values.end())
        return std::nullopt;
    if (const T* v = std::get_if<T>(&it->second))
        return *v;
    return std::nullopt;
}

std::optional<std::string> MemoryPreferenceStore::get_string(std::string_view key) const
{
    return read_as<std::string>(values_, key);
}

std::optional<double> MemoryPreferenceStore::get_number(std::string_view key) const
{
    return read_as<double>(values_, key);
}

std::optional<bool> MemoryPreferenceStore::get_bool(std::string_view key) const
{
    return read_as<bool>(values_, key);
}

std::optional<std::vector<std::string>> MemoryPreferenceStore::get_list(std::string_view key) const
{
    return read_as<std::vector<std::string>>(values_, key);
}

void MemoryPreferenceStore::set_string(std::string_view key, std::string value)
{
    store(key, std::move(value));
}

void MemoryPreferenceStore::set_number(std::string_view key, double value)
{
    store(key, value);
}

void MemoryPreferenceStore::set_bool(std::string_view key, bool value)
{
    store(key, value);
}

void MemoryPreferenceStore::set_list(std::string_view key, std::vector<std::string> value)
{
    store(key, std::move(value));
}

bool MemoryPreferenceStore::remove(std::string_view key)
{
    auto it = values_.find(key);
    if (it == values_.end())
        return false;
    values_.erase(it);
    ++write_count_;
    on_changed();
    return true;
}

bool MemoryPreferenceStore::contains(std::string_view key) const
{
    return values_.find(key) != values_.end();
}

void MemoryPreferenceStore::store(std::string_view key, Value value)
{
    auto it = values_.find(key);
    if (it == values_.end())
        values_.emplace(std::string(key), std::move(value));
    else
        it->second = std::move(value);
    ++write_count_;
    on_changed();
}

JsonValue MemoryPreferenceStore::to_json() const
{
    JsonValue obj = JsonValue::object();
    for (const auto& entry : values_)
    {
        const std::string& key = entry.first;
        std::visit(
            [&](const auto& v)
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::vector<std::string>>)
                    obj.set(key, JsonValue::string_list(v));
                else
                    obj.set(key, JsonValue(v));
            },
            entry.second);
    }
    return obj;
}

void MemoryPreferenceStore::assign_from_json(const JsonValue& obj)
{
    values_.clear();
    for (const auto& [key, v] : obj.as_object())
    {
        switch (v.type())
        {
            case JsonValue::Type::Bool:
                values_.emplace(key, v.as_bool());
                break;
            case JsonValue::Type::Number:
                values_.emplace(key, v.as_number());
                break;
            case JsonValue::Type::String:
                values_.emplace(key, v.as_string());
                break;
            case JsonValue::Type::Array:
            {
                std::vector<std::string> list;
                bool                     all_strings = true;
                for (const auto& item : v.as_array())
                {
                    if (!item.is_string())
                    {
                        all_strings = false;
                        break;
                    }
                    list.push_back(item.as_string());
                }
                if (all_strings)
                    values_.emplace(key, std::move(list));
                else
                    TERMDECK_LOG_WARN("prefs", "Ignoring non-string list for key '{}'", key);
                break;
            }
            default:
                TERMDECK_LOG_DEBUG("prefs", "Ignoring unsupported value for key '{}'", key);
                break;
        }
    }
}

// ─── FilePreferenceStore ─────────────────────────────────────────────────────

FilePreferenceStore::FilePreferenceStore(std::string path) : path_(std::move(path)) {}

std::string FilePreferenceStore::default_path()
{
    return config_file_path("preferences.json");
}

bool FilePreferenceStore::load()
{
    auto text = read_text_file(path_);
    if (!text)
    {
        TERMDECK_LOG_DEBUG("prefs", "No preference file at {}", path_);
        return true;
    }

    auto doc = JsonValue::parse(*text);
    if (!doc || !doc->is_object())
    {
        TERMDECK_LOG_WARN("prefs", "Malformed preference file {}, using defaults", path_);
        clear();
        return false;
    }

    assign_from_json(*doc);
    TERMDECK_LOG_DEBUG("prefs", "Loaded {} preferences from {}", size(), path_);
    return true;
}

bool FilePreferenceStore::save() const
{
    if (!write_text_file(path_, to_json().dump()))
    {
        TERMDECK_LOG_WARN("prefs", "Failed to write preference file {}", path_);
        return false;
    }
    return true;
}

void FilePreferenceStore::on_changed()
{
    last_save_ok_ = save();
}

}   // namespace termdeck
