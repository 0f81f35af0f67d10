#pragma once

// Stand-in collaborators for the demos. Probes and lookups complete on a
// worker thread after a short delay, the way a real terminal host would, so
// the demos exercise completion marshalling through pump().

#include <termdeck/catalog.hpp>
#include <termdeck/logger.hpp>
#include <termdeck/process_backend.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace termdeck::demo
{

// Runs queued jobs on one thread, each after `delay`.
class DelayedWorker
{
   public:
    explicit DelayedWorker(std::chrono::milliseconds delay) : delay_(delay)
    {
        thread_ = std::thread([this] { run(); });
    }

    ~DelayedWorker()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    void post(std::function<void()> job)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

   private:
    std::chrono::milliseconds         delay_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    std::deque<std::function<void()>> jobs_;
    bool                              stopping_ = false;
    std::thread                       thread_;

    void run()
    {
        while (true)
        {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (stopping_)
                    return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            std::this_thread::sleep_for(delay_);
            job();
        }
    }
};

// Every process is alive until terminated; terminate() reports an exit.
class SimulatedProcessBackend : public ProcessBackend
{
   public:
    explicit SimulatedProcessBackend(std::chrono::milliseconds delay = std::chrono::milliseconds(30))
        : worker_(delay)
    {
    }

    void probe_alive(const ProcessId& id, ProbeCallback done) override
    {
        worker_.post(
            [this, id, done = std::move(done)]()
            {
                bool alive;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    alive = dead_.count(id) == 0;
                }
                done(alive);
            });
    }

    SubscriptionId subscribe_exit(ExitCallback on_exit) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const SubscriptionId        id = next_subscription_++;
        subscribers_[id]               = std::move(on_exit);
        return id;
    }

    void unsubscribe_exit(SubscriptionId id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(id);
    }

    void terminate(const ProcessId& id) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dead_.insert(id);
        }
        TERMDECK_LOG_INFO("sim", "Terminating {}", id);
        worker_.post([this, id]() { emit_exit(id); });
    }

    void purge_scrollback(const ProcessId& id) override { TERMDECK_LOG_DEBUG("sim", "Purged scrollback of {}", id); }

    // Simulates a process dying on its own.
    void kill(const ProcessId& id)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dead_.insert(id);
        }
        worker_.post([this, id]() { emit_exit(id); });
    }

   private:
    std::mutex                             mutex_;
    std::set<ProcessId>                    dead_;
    std::map<SubscriptionId, ExitCallback> subscribers_;
    SubscriptionId                         next_subscription_ = 1;
    // Last member: joined before the state above goes away.
    DelayedWorker worker_;

    void emit_exit(const ProcessId& id)
    {
        std::map<SubscriptionId, ExitCallback> subs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subs = subscribers_;
        }
        for (auto& [sid, cb] : subs)
            cb(id);
    }
};

// Knows a fixed set of skills and commands.
class SimulatedCatalog : public CatalogService
{
   public:
    SimulatedCatalog() : worker_(std::chrono::milliseconds(50))
    {
        add(CatalogKind::Skill, "code-review", "Review a diff for correctness and style");
        add(CatalogKind::Skill, "release-notes", "Draft release notes from merged changes");
        add(CatalogKind::Command, "deploy", "Deploy the current branch to staging");
    }

    void lookup_catalog_item(CatalogKind kind, const std::string& id, LookupCallback done) override
    {
        std::optional<CatalogItem> found;
        if (auto it = items_.find({kind, id}); it != items_.end())
            found = it->second;
        worker_.post([found = std::move(found), done = std::move(done)]() { done(found); });
    }

   private:
    std::map<std::pair<CatalogKind, std::string>, CatalogItem> items_;
    DelayedWorker                                              worker_;

    void add(CatalogKind kind, const std::string& name, const std::string& description)
    {
        CatalogItem item;
        item.name        = name;
        item.description = description;
        item.path        = std::string("/home/user/.claude/")
                    + (kind == CatalogKind::Skill ? "skills/" : "commands/") + name;
        items_[{kind, name}] = std::move(item);
    }
};

}   // namespace termdeck::demo
