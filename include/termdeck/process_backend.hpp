#pragma once

#include <termdeck/types.hpp>

#include <cstdint>
#include <functional>

namespace termdeck
{

// External owner of the interactive processes behind sessions.
//
// Completion callbacks may be invoked synchronously from inside the call or
// later. A backend that reports from a worker thread must be wrapped so that
// callbacks land on the UI thread (see WorkspaceController).
class ProcessBackend
{
   public:
    using ProbeCallback  = std::function<void(bool alive)>;
    using ExitCallback   = std::function<void(const ProcessId& id)>;
    using SubscriptionId = uint64_t;

    virtual ~ProcessBackend() = default;

    // Asks whether `id` still exists. `done` is called once. Transport
    // failures must be reported as `false`, never thrown.
    virtual void probe_alive(const ProcessId& id, ProbeCallback done) = 0;

    // Unsolicited "process exited" feed. Delivery is at-least-once and
    // unordered relative to probe completions.
    virtual SubscriptionId subscribe_exit(ExitCallback on_exit) = 0;
    virtual void           unsubscribe_exit(SubscriptionId id)  = 0;

    // Fire-and-forget teardown requests.
    virtual void terminate(const ProcessId& id)        = 0;
    virtual void purge_scrollback(const ProcessId& id) = 0;
};

// RAII handle for an exit-feed subscription.
class ExitSubscription
{
   public:
    ExitSubscription() = default;
    ExitSubscription(ProcessBackend& backend, ProcessBackend::SubscriptionId id)
        : backend_(&backend), id_(id)
    {
    }
    ~ExitSubscription() { reset(); }

    ExitSubscription(const ExitSubscription&)            = delete;
    ExitSubscription& operator=(const ExitSubscription&) = delete;

    ExitSubscription(ExitSubscription&& other) noexcept
        : backend_(other.backend_), id_(other.id_)
    {
        other.backend_ = nullptr;
    }

    ExitSubscription& operator=(ExitSubscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            backend_       = other.backend_;
            id_            = other.id_;
            other.backend_ = nullptr;
        }
        return *this;
    }

    bool active() const { return backend_ != nullptr; }

    void reset()
    {
        if (backend_)
        {
            backend_->unsubscribe_exit(id_);
            backend_ = nullptr;
        }
    }

   private:
    ProcessBackend*                backend_ = nullptr;
    ProcessBackend::SubscriptionId id_      = 0;
};

}   // namespace termdeck
