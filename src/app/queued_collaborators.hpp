#pragma once

#include <termdeck/catalog.hpp>
#include <termdeck/process_backend.hpp>

#include <functional>
#include <memory>

#include "core/command_queue.hpp"

namespace termdeck
{

// Posts `fn` to `queue`. Completions are never dropped while the queue is
// open: a full ring spills to the overflow list. False only once the queue
// has been closed.
bool post_to_queue(CommandQueue& queue, std::function<void()> fn, const char* what);

// ProcessBackend decorator that defers every completion callback to a
// CommandQueue, so the callbacks run on whichever thread drains it.
//
// The queue is shared: a callback the inner backend fires after this
// decorator is gone still lands in a valid (if never drained) queue.
class QueuedProcessBackend : public ProcessBackend
{
   public:
    QueuedProcessBackend(ProcessBackend& inner, std::shared_ptr<CommandQueue> queue);

    void           probe_alive(const ProcessId& id, ProbeCallback done) override;
    SubscriptionId subscribe_exit(ExitCallback on_exit) override;
    void           unsubscribe_exit(SubscriptionId id) override;
    void           terminate(const ProcessId& id) override;
    void           purge_scrollback(const ProcessId& id) override;

   private:
    ProcessBackend&               inner_;
    std::shared_ptr<CommandQueue> queue_;
};

class QueuedCatalogService : public CatalogService
{
   public:
    QueuedCatalogService(CatalogService& inner, std::shared_ptr<CommandQueue> queue);

    void lookup_catalog_item(CatalogKind kind, const std::string& id, LookupCallback done) override;

   private:
    CatalogService&               inner_;
    std::shared_ptr<CommandQueue> queue_;
};

}   // namespace termdeck
