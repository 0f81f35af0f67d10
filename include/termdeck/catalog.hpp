#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace termdeck
{

enum class CatalogKind
{
    Skill,
    Command
};

inline std::string_view to_string(CatalogKind kind)
{
    return kind == CatalogKind::Skill ? "skill" : "command";
}

// A locally installed skill or command, as returned by the catalog service.
struct CatalogItem
{
    std::string                name;
    std::string                path;
    std::string                description;
    std::string                content;
    std::optional<std::string> source_id;
    std::optional<std::string> source_name;
    std::optional<std::string> author;
    std::optional<uint64_t>    downloads;

    bool operator==(const CatalogItem&) const = default;
};

// Lookup service behind detail hydration. `done` receives nullopt when the
// item does not exist; a failing lookup may also throw, which callers treat
// the same way.
class CatalogService
{
   public:
    using LookupCallback = std::function<void(std::optional<CatalogItem>)>;

    virtual ~CatalogService() = default;

    virtual void lookup_catalog_item(CatalogKind kind, const std::string& id, LookupCallback done) = 0;
};

}   // namespace termdeck
