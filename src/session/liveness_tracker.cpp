#include "liveness_tracker.hpp"

#include <termdeck/logger.hpp>

#include <exception>

namespace termdeck
{

ProcessLivenessTracker::ProcessLivenessTracker(ProcessBackend& backend) : backend_(backend) {}

ProcessLivenessTracker::~ProcessLivenessTracker()
{
    stop();
}

void ProcessLivenessTracker::start()
{
    if (started_)
        return;

    started_ = true;
    token_   = std::make_shared<ProcessLivenessTracker*>(this);

    std::weak_ptr<ProcessLivenessTracker*> weak = token_;
    subscription_ = ExitSubscription(backend_,
                                     backend_.subscribe_exit(
                                         [weak](const ProcessId& id)
                                         {
                                             if (auto self = weak.lock())
                                                 (*self)->on_exit(id);
                                         }));

    TERMDECK_LOG_DEBUG("liveness", "Started, tracking {} ids", tracked_.size());
    start_batch();
}

void ProcessLivenessTracker::stop()
{
    if (!started_)
        return;

    started_ = false;
    token_.reset();
    subscription_.reset();
    batch_.reset();
    TERMDECK_LOG_DEBUG("liveness", "Stopped");
}

void ProcessLivenessTracker::set_tracked(const std::vector<ProcessId>& ids)
{
    std::unordered_set<ProcessId> next(ids.begin(), ids.end());
    if (next == tracked_)
        return;

    tracked_ = std::move(next);

    // Leaving the tracked set ends that id's tracked lifetime.
    for (auto it = exited_.begin(); it != exited_.end();)
    {
        if (tracked_.count(*it) == 0)
            it = exited_.erase(it);
        else
            ++it;
    }

    bool pruned = false;
    for (auto it = liveness_.begin(); it != liveness_.end();)
    {
        if (tracked_.count(it->first) == 0)
        {
            it     = liveness_.erase(it);
            pruned = true;
        }
        else
        {
            ++it;
        }
    }
    if (pruned)
        notify();

    if (started_)
        start_batch();
}

void ProcessLivenessTracker::refresh()
{
    if (started_)
        start_batch();
}

std::optional<bool> ProcessLivenessTracker::is_running(const ProcessId& id) const
{
    auto it = liveness_.find(id);
    if (it == liveness_.end())
        return std::nullopt;
    return it->second;
}

void ProcessLivenessTracker::start_batch()
{
    auto batch        = std::make_unique<Batch>();
    batch->generation = ++generation_;
    batch->ids.assign(tracked_.begin(), tracked_.end());
    batch->results.resize(batch->ids.size());
    batch->pending = batch->ids.size();

    if (batch->ids.empty())
    {
        commit(*batch);
        batch_.reset();
        return;
    }

    batch_ = std::move(batch);

    // Copy: a synchronous backend may complete (and commit) the batch before
    // this loop is done.
    const uint64_t                         generation = batch_->generation;
    const std::vector<ProcessId>           ids        = batch_->ids;
    std::weak_ptr<ProcessLivenessTracker*> weak       = token_;

    for (size_t i = 0; i < ids.size(); ++i)
    {
        try
        {
            backend_.probe_alive(ids[i],
                                 [weak, generation, i](bool alive)
                                 {
                                     if (auto self = weak.lock())
                                         (*self)->on_probe_result(generation, i, alive);
                                 });
        }
        catch (const std::exception& e)
        {
            TERMDECK_LOG_WARN("liveness", "Probe for {} failed: {}", ids[i], e.what());
            on_probe_result(generation, i, false);
        }

        // The batch may have been superseded or the tracker stopped from
        // inside a callback.
        if (!batch_ || batch_->generation != generation)
            return;
    }
}

void ProcessLivenessTracker::on_probe_result(uint64_t generation, size_t index, bool alive)
{
    if (!batch_ || batch_->generation != generation)
    {
        TERMDECK_LOG_TRACE("liveness", "Dropping result from stale batch {}", generation);
        return;
    }
    if (index >= batch_->results.size() || batch_->results[index].has_value())
        return;   // duplicate completion

    batch_->results[index] = alive;
    if (--batch_->pending > 0)
        return;

    std::unique_ptr<Batch> done = std::move(batch_);
    commit(*done);
}

void ProcessLivenessTracker::commit(Batch& batch)
{
    LivenessMap next;
    next.reserve(batch.ids.size());
    for (size_t i = 0; i < batch.ids.size(); ++i)
    {
        const ProcessId& id = batch.ids[i];
        // An exit reported since the batch started wins over its result.
        next[id] = exited_.count(id) ? false : batch.results[i].value_or(false);
    }

    liveness_ = std::move(next);
    TERMDECK_LOG_DEBUG("liveness", "Committed batch {} ({} ids)", batch.generation, liveness_.size());
    notify();
}

void ProcessLivenessTracker::on_exit(const ProcessId& id)
{
    if (tracked_.count(id) == 0)
    {
        TERMDECK_LOG_TRACE("liveness", "Exit for untracked id {}", id);
        return;
    }

    exited_.insert(id);
    auto it = liveness_.find(id);
    if (it != liveness_.end() && !it->second)
        return;   // at-least-once delivery

    liveness_[id] = false;
    TERMDECK_LOG_DEBUG("liveness", "Process {} exited", id);
    notify();
}

void ProcessLivenessTracker::notify()
{
    if (on_change_)
        on_change_(liveness_);
}

}   // namespace termdeck
