#pragma once

#include <termdeck/preferences.hpp>

#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace termdeck
{

class JsonValue;

// In-memory preference store. Base of the file-backed store; used directly by
// tests and the headless demo.
class MemoryPreferenceStore : public PreferenceStore
{
   public:
    using Value = std::variant<bool, double, std::string, std::vector<std::string>>;

    MemoryPreferenceStore()           = default;
    ~MemoryPreferenceStore() override = default;

    std::optional<std::string>              get_string(std::string_view key) const override;
    std::optional<double>                   get_number(std::string_view key) const override;
    std::optional<bool>                     get_bool(std::string_view key) const override;
    std::optional<std::vector<std::string>> get_list(std::string_view key) const override;

    void set_string(std::string_view key, std::string value) override;
    void set_number(std::string_view key, double value) override;
    void set_bool(std::string_view key, bool value) override;
    void set_list(std::string_view key, std::vector<std::string> value) override;

    bool remove(std::string_view key) override;

    size_t size() const { return values_.size(); }
    bool   contains(std::string_view key) const;
    void   clear() { values_.clear(); }

    // Number of set_*/remove calls that reached the store.
    size_t write_count() const { return write_count_; }

   protected:
    // Called after every successful write.
    virtual void on_changed() {}

    JsonValue to_json() const;
    void      assign_from_json(const JsonValue& obj);

   private:
    void store(std::string_view key, Value value);

    std::map<std::string, Value, std::less<>> values_;
    size_t                                    write_count_ = 0;
};

// Flat JSON object on disk. Loaded once by load(); every write rewrites the
// whole file.
class FilePreferenceStore : public MemoryPreferenceStore
{
   public:
    explicit FilePreferenceStore(std::string path = default_path());

    // Missing file: true with no values. Malformed file: false, logged, and the
    // store stays empty so defaults apply.
    bool load();
    bool save() const;

    const std::string& path() const { return path_; }
    bool               last_save_ok() const { return last_save_ok_; }

    static std::string default_path();

   protected:
    void on_changed() override;

   private:
    std::string path_;
    bool        last_save_ok_ = true;
};

}   // namespace termdeck
