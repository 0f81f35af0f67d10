#pragma once

#include <termdeck/catalog.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "nav/location.hpp"
#include "nav/navigation_entry.hpp"

namespace termdeck
{

enum class HydrationStatus
{
    Idle,        // never started, or the location needs no lookup
    Pending,     // lookup in flight
    Hydrated,    // detail entry pushed
    NotFound,    // lookup failed or found nothing; history untouched
    Discarded    // found, but the user had navigated away meanwhile
};

const char* to_string(HydrationStatus status);

// What to do with a lookup that resolves after the user navigated elsewhere.
enum class HydrationPolicy
{
    DiscardIfNavigated,
    AppendAlways
};

// Linear back/forward history: a list of entries and a cursor.
//
// push() drops everything after the cursor before appending, so abandoned
// forward entries never come back. back()/forward() move the cursor within
// bounds and are no-ops at either end.
class NavigationHistory
{
   public:
    using ChangeCallback = std::function<void()>;

    explicit NavigationHistory(NavigationEntry initial);

    // Seeded from a location string; the entry is derived without any lookup.
    explicit NavigationHistory(std::string_view location);

    NavigationHistory(const NavigationHistory&)            = delete;
    NavigationHistory& operator=(const NavigationHistory&) = delete;

    void push(NavigationEntry entry);
    bool back();
    bool forward();

    bool can_go_back() const { return index_ > 0; }
    bool can_go_forward() const { return index_ + 1 < static_cast<int>(entries_.size()); }

    const NavigationEntry&              current() const { return entries_[static_cast<size_t>(index_)]; }
    const std::vector<NavigationEntry>& entries() const { return entries_; }
    int                                 index() const { return index_; }
    size_t                              size() const { return entries_.size(); }

    // ── Detail hydration ────────────────────────────────────────────────

    // One-shot: the first call with a detail location starts a catalog lookup
    // and pushes the resolved detail entry; every later call does nothing.
    // Returns true if a lookup was started.
    bool hydrate(const Location& location, CatalogService& catalog);

    bool               hydration_started() const { return hydration_started_; }
    HydrationStatus    hydration_status() const { return hydration_status_; }
    const std::string& hydration_message() const { return hydration_message_; }
    void               clear_hydration_message() { hydration_message_.clear(); }

    HydrationPolicy hydration_policy() const { return policy_; }
    void            set_hydration_policy(HydrationPolicy policy) { policy_ = policy; }

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    std::vector<NavigationEntry> entries_;
    int                          index_ = 0;

    // Bumped by every navigation; lets a late lookup tell whether the user
    // is still where it started.
    uint64_t navigation_serial_ = 0;

    bool            hydration_started_ = false;
    HydrationStatus hydration_status_  = HydrationStatus::Idle;
    std::string     hydration_message_;
    HydrationPolicy policy_ = HydrationPolicy::DiscardIfNavigated;

    std::shared_ptr<NavigationHistory*> token_;

    ChangeCallback on_change_;

    void finish_hydration(const HydrationRequest&    request,
                          uint64_t                   serial,
                          std::optional<CatalogItem> item);
    void notify();
};

}   // namespace termdeck
