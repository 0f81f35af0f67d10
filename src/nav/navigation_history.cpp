#include "navigation_history.hpp"

#include <termdeck/logger.hpp>

#include <exception>

namespace termdeck
{

const char* to_string(HydrationStatus status)
{
    switch (status)
    {
        case HydrationStatus::Idle:
            return "idle";
        case HydrationStatus::Pending:
            return "pending";
        case HydrationStatus::Hydrated:
            return "hydrated";
        case HydrationStatus::NotFound:
            return "not-found";
        case HydrationStatus::Discarded:
            return "discarded";
    }
    return "unknown";
}

NavigationHistory::NavigationHistory(NavigationEntry initial)
    : token_(std::make_shared<NavigationHistory*>(this))
{
    entries_.push_back(std::move(initial));
}

NavigationHistory::NavigationHistory(std::string_view location)
    : NavigationHistory(initial_entry_for(parse_location(location)))
{
}

void NavigationHistory::push(NavigationEntry entry)
{
    entries_.erase(entries_.begin() + index_ + 1, entries_.end());
    entries_.push_back(std::move(entry));
    index_ = static_cast<int>(entries_.size()) - 1;
    ++navigation_serial_;
    TERMDECK_LOG_DEBUG("nav", "Push {} ({} entries)", std::string(view_kind(current())), entries_.size());
    notify();
}

bool NavigationHistory::back()
{
    if (!can_go_back())
        return false;
    --index_;
    ++navigation_serial_;
    notify();
    return true;
}

bool NavigationHistory::forward()
{
    if (!can_go_forward())
        return false;
    ++index_;
    ++navigation_serial_;
    notify();
    return true;
}

bool NavigationHistory::hydrate(const Location& location, CatalogService& catalog)
{
    if (hydration_started_)
        return false;
    hydration_started_ = true;

    auto request = hydration_request_for(location);
    if (!request)
        return false;

    hydration_status_ = HydrationStatus::Pending;
    hydration_message_.clear();
    TERMDECK_LOG_DEBUG("nav", "Hydrating {} '{}'", std::string(to_string(request->kind)), request->id);

    const uint64_t                    serial = navigation_serial_;
    std::weak_ptr<NavigationHistory*> weak   = token_;
    HydrationRequest                  req    = *request;

    try
    {
        catalog.lookup_catalog_item(request->kind,
                                    request->id,
                                    [weak, req, serial](std::optional<CatalogItem> item)
                                    {
                                        if (auto self = weak.lock())
                                            (*self)->finish_hydration(req, serial, std::move(item));
                                    });
    }
    catch (const std::exception& e)
    {
        TERMDECK_LOG_WARN("nav", "Catalog lookup for '{}' failed: {}", request->id, e.what());
        finish_hydration(req, serial, std::nullopt);
    }
    return true;
}

void NavigationHistory::finish_hydration(const HydrationRequest&    request,
                                         uint64_t                   serial,
                                         std::optional<CatalogItem> item)
{
    if (hydration_status_ != HydrationStatus::Pending)
        return;   // already resolved

    if (!item)
    {
        hydration_status_  = HydrationStatus::NotFound;
        hydration_message_ = std::string(request.kind == CatalogKind::Skill ? "Skill" : "Command")
                             + " \"" + request.id + "\" not found";
        TERMDECK_LOG_INFO("nav", "{}", hydration_message_);
        notify();
        return;
    }

    if (policy_ == HydrationPolicy::DiscardIfNavigated && serial != navigation_serial_)
    {
        hydration_status_ = HydrationStatus::Discarded;
        TERMDECK_LOG_DEBUG("nav", "Dropping hydrated '{}': user navigated away", request.id);
        notify();
        return;
    }

    hydration_status_ = HydrationStatus::Hydrated;
    if (request.kind == CatalogKind::Skill)
    {
        std::string path = item->path;
        push(SkillDetailView{std::move(*item), std::move(path), true});
    }
    else
    {
        push(CommandDetailView{std::move(*item)});
    }
}

void NavigationHistory::notify()
{
    if (on_change_)
        on_change_();
}

}   // namespace termdeck
