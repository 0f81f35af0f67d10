#include "queued_collaborators.hpp"

#include <termdeck/logger.hpp>

namespace termdeck
{

bool post_to_queue(CommandQueue& queue, std::function<void()> fn, const char* what)
{
    bool spilled = false;
    if (!queue.post(std::move(fn), &spilled))
    {
        TERMDECK_LOG_TRACE("app", "Workspace gone, dropping {}", what);
        return false;
    }
    if (spilled)
        TERMDECK_LOG_WARN("app", "Completion queue full, {} waits in overflow", what);
    return true;
}

// ─── QueuedProcessBackend ────────────────────────────────────────────────────

QueuedProcessBackend::QueuedProcessBackend(ProcessBackend& inner, std::shared_ptr<CommandQueue> queue)
    : inner_(inner), queue_(std::move(queue))
{
}

void QueuedProcessBackend::probe_alive(const ProcessId& id, ProbeCallback done)
{
    auto queue = queue_;
    inner_.probe_alive(id,
                       [queue, done = std::move(done)](bool alive)
                       { post_to_queue(*queue, [done, alive]() { done(alive); }, "probe result"); });
}

ProcessBackend::SubscriptionId QueuedProcessBackend::subscribe_exit(ExitCallback on_exit)
{
    auto queue = queue_;
    return inner_.subscribe_exit(
        [queue, on_exit = std::move(on_exit)](const ProcessId& id)
        { post_to_queue(*queue, [on_exit, id]() { on_exit(id); }, "exit event"); });
}

void QueuedProcessBackend::unsubscribe_exit(SubscriptionId id)
{
    inner_.unsubscribe_exit(id);
}

void QueuedProcessBackend::terminate(const ProcessId& id)
{
    inner_.terminate(id);
}

void QueuedProcessBackend::purge_scrollback(const ProcessId& id)
{
    inner_.purge_scrollback(id);
}

// ─── QueuedCatalogService ────────────────────────────────────────────────────

QueuedCatalogService::QueuedCatalogService(CatalogService& inner, std::shared_ptr<CommandQueue> queue)
    : inner_(inner), queue_(std::move(queue))
{
}

void QueuedCatalogService::lookup_catalog_item(CatalogKind kind, const std::string& id, LookupCallback done)
{
    auto queue = queue_;
    inner_.lookup_catalog_item(
        kind,
        id,
        [queue, done = std::move(done)](std::optional<CatalogItem> item)
        {
            post_to_queue(
                *queue,
                [done, item = std::move(item)]() mutable { done(std::move(item)); },
                "catalog lookup");
        });
}

}   // namespace termdeck
