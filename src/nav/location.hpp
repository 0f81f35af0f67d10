#pragma once

#include <termdeck/catalog.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nav/navigation_entry.hpp"

namespace termdeck
{

// A hash-routed location "/<feature>[/<id>[/<subId>]]", split into decoded
// segments. A leading '#', leading/trailing/duplicate slashes and any
// "?query" suffix are ignored.
struct Location
{
    std::vector<std::string> segments;

    bool operator==(const Location&) const = default;
};

Location parse_location(std::string_view raw);

// The view a location renders synchronously, from the location alone.
// Detail routes that need a lookup ("skills/<name>", "commands/<name>")
// yield their list view; unknown features yield HomeView.
NavigationEntry initial_entry_for(const Location& location);

struct HydrationRequest
{
    CatalogKind kind = CatalogKind::Skill;
    std::string id;

    bool operator==(const HydrationRequest&) const = default;
};

// The lookup that upgrades the initial entry to a detail entry, if any.
std::optional<HydrationRequest> hydration_request_for(const Location& location);

// Canonical location string for an entry, ids percent-encoded.
std::string format_location(const NavigationEntry& entry);

// Invalid escapes are kept literally.
std::string percent_decode(std::string_view s);
std::string percent_encode(std::string_view s);

}   // namespace termdeck
