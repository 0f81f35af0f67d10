#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termdeck
{

// String-keyed persisted preference store. Reads never fail loudly: a missing
// key or a value of another type reads as nullopt. No transactional guarantee
// across keys.
class PreferenceStore
{
   public:
    virtual ~PreferenceStore() = default;

    virtual std::optional<std::string>              get_string(std::string_view key) const = 0;
    virtual std::optional<double>                   get_number(std::string_view key) const = 0;
    virtual std::optional<bool>                     get_bool(std::string_view key) const   = 0;
    virtual std::optional<std::vector<std::string>> get_list(std::string_view key) const   = 0;

    virtual void set_string(std::string_view key, std::string value)            = 0;
    virtual void set_number(std::string_view key, double value)                 = 0;
    virtual void set_bool(std::string_view key, bool value)                     = 0;
    virtual void set_list(std::string_view key, std::vector<std::string> value) = 0;

    virtual bool remove(std::string_view key) = 0;
};

namespace pref_keys
{
inline constexpr std::string_view LAYOUT_MODE            = "termdeck:layoutMode";
inline constexpr std::string_view PINNED_ZONE_COLLAPSED  = "termdeck:pinnedZoneCollapsed";
inline constexpr std::string_view PINNED_EXPANDED_PANELS = "termdeck:pinnedExpandedPanels";
inline constexpr std::string_view PINNED_ZONE_WIDTH      = "termdeck:pinnedZoneWidth";
inline constexpr std::string_view ACTIVE_PANEL_ID        = "termdeck:activePanelId";
}   // namespace pref_keys

}   // namespace termdeck
