#pragma once

// In-memory stand-ins for the external collaborators. Completions are held
// until the test resolves them, so ordering between probes, exit events and
// lookups is under the test's control.

#include <termdeck/catalog.hpp>
#include <termdeck/process_backend.hpp>

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "ui/pointer_capture.hpp"

namespace termdeck::test
{

class FakeProcessBackend : public ProcessBackend
{
   public:
    struct PendingProbe
    {
        ProcessId     id;
        ProbeCallback done;
    };

    // ── ProcessBackend ──────────────────────────────────────────────────

    void probe_alive(const ProcessId& id, ProbeCallback done) override
    {
        ++probe_calls;
        if (throw_on_probe.count(id))
            throw std::runtime_error("backend unreachable");
        if (auto it = auto_answer.find(id); it != auto_answer.end())
        {
            done(it->second);
            return;
        }
        pending.push_back({id, std::move(done)});
    }

    SubscriptionId subscribe_exit(ExitCallback on_exit) override
    {
        const SubscriptionId id = next_subscription_++;
        subscribers_[id]        = std::move(on_exit);
        return id;
    }

    void unsubscribe_exit(SubscriptionId id) override
    {
        subscribers_.erase(id);
        ++unsubscribe_calls;
    }

    void terminate(const ProcessId& id) override { terminated.push_back(id); }
    void purge_scrollback(const ProcessId& id) override { purged.push_back(id); }

    // ── Test controls ───────────────────────────────────────────────────

    // Answer the oldest pending probe for `id`. False if none is pending.
    bool resolve(const ProcessId& id, bool alive)
    {
        for (auto it = pending.begin(); it != pending.end(); ++it)
        {
            if (it->id == id)
            {
                ProbeCallback done = std::move(it->done);
                pending.erase(it);
                done(alive);
                return true;
            }
        }
        return false;
    }

    // Answer every pending probe with the same value.
    size_t resolve_all(bool alive)
    {
        std::vector<PendingProbe> batch;
        batch.swap(pending);
        for (auto& p : batch)
            p.done(alive);
        return batch.size();
    }

    void emit_exit(const ProcessId& id)
    {
        // Copy: a handler may unsubscribe.
        auto subs = subscribers_;
        for (auto& [sid, cb] : subs)
            cb(id);
    }

    size_t subscriber_count() const { return subscribers_.size(); }

    size_t pending_count(const ProcessId& id) const
    {
        size_t n = 0;
        for (const auto& p : pending)
            n += p.id == id ? 1 : 0;
        return n;
    }

    std::vector<PendingProbe>   pending;
    std::map<ProcessId, bool>   auto_answer;
    std::set<ProcessId>         throw_on_probe;
    std::vector<ProcessId>      terminated;
    std::vector<ProcessId>      purged;
    size_t                      probe_calls       = 0;
    size_t                      unsubscribe_calls = 0;

   private:
    SubscriptionId                         next_subscription_ = 1;
    std::map<SubscriptionId, ExitCallback> subscribers_;
};

class FakeCatalogService : public CatalogService
{
   public:
    struct PendingLookup
    {
        CatalogKind    kind;
        std::string    id;
        LookupCallback done;
    };

    void lookup_catalog_item(CatalogKind kind, const std::string& id, LookupCallback done) override
    {
        if (throw_on_lookup)
            throw std::runtime_error("catalog offline");
        pending.push_back({kind, id, std::move(done)});
    }

    // Complete the oldest pending lookup. False if none is pending.
    bool resolve(std::optional<CatalogItem> item)
    {
        if (pending.empty())
            return false;
        LookupCallback done = std::move(pending.front().done);
        pending.erase(pending.begin());
        done(std::move(item));
        return true;
    }

    static CatalogItem item(std::string name, std::string path = {})
    {
        CatalogItem it;
        it.name        = std::move(name);
        it.path        = path.empty() ? "/home/user/.claude/skills/" + it.name : std::move(path);
        it.description = "test item";
        return it;
    }

    std::vector<PendingLookup> pending;
    bool                       throw_on_lookup = false;
};

// Records begin/end calls and lets the test drive the captured handlers.
class RecordingPointerCapture : public PointerCapture
{
   public:
    Token begin_capture(SplitDirection axis, MoveHandler on_move, ReleaseHandler on_release) override
    {
        ++begin_calls;
        active_token = next_token_++;
        last_axis    = axis;
        on_move_     = std::move(on_move);
        on_release_  = std::move(on_release);
        return active_token;
    }

    void end_capture(Token token) override
    {
        ++end_calls;
        if (token != active_token)
            return;
        active_token = 0;
        on_move_     = nullptr;
        on_release_  = nullptr;
    }

    bool active() const { return active_token != 0; }

    void move(float x, float y)
    {
        if (auto cb = on_move_)
            cb(x, y);
    }

    // Pointer up, focus loss or the pointer leaving the window.
    void release()
    {
        if (auto cb = on_release_)
            cb();
    }

    Token          active_token = 0;
    SplitDirection last_axis    = SplitDirection::Horizontal;
    int            begin_calls  = 0;
    int            end_calls    = 0;

   private:
    Token          next_token_ = 1;
    MoveHandler    on_move_;
    ReleaseHandler on_release_;
};

}   // namespace termdeck::test
