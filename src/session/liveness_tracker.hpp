#pragma once

#include <termdeck/process_backend.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace termdeck
{

// Session process liveness, reconciled from two channels:
//
//  - Probe batches. Whenever the tracked set changes (and on start), one
//    probe per id is issued. Results are collected off to the side and
//    committed in a single replace of the whole map once every probe in the
//    batch has answered. A batch superseded by a newer one is discarded.
//  - Exit events. An exit for a tracked id patches that id to false at once,
//    even with a batch in flight.
//
// Exit events are monotonic within a tracked lifetime: once an id has been
// reported exited, no probe result sets it back to running until the id
// leaves the tracked set. Events for untracked ids are ignored.
//
// Ids without an entry have not been checked yet; that is distinct from
// false.
class ProcessLivenessTracker
{
   public:
    using LivenessMap    = std::unordered_map<ProcessId, bool>;
    using ChangeCallback = std::function<void(const LivenessMap&)>;

    explicit ProcessLivenessTracker(ProcessBackend& backend);
    ~ProcessLivenessTracker();

    ProcessLivenessTracker(const ProcessLivenessTracker&)            = delete;
    ProcessLivenessTracker& operator=(const ProcessLivenessTracker&) = delete;

    // Subscribe to exit events and probe the current tracked set.
    void start();
    // Release the subscription. Results arriving afterwards are dropped.
    void stop();
    bool is_started() const { return started_; }

    // Replace the tracked set. Starts a new batch when the set differs.
    void set_tracked(const std::vector<ProcessId>& ids);
    // Start a new batch for the current set.
    void refresh();

    std::optional<bool> is_running(const ProcessId& id) const;
    const LivenessMap&  liveness() const { return liveness_; }

    bool     batch_in_flight() const { return batch_ != nullptr; }
    uint64_t generation() const { return generation_; }
    size_t   tracked_count() const { return tracked_.size(); }

    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    struct Batch
    {
        uint64_t                         generation = 0;
        std::vector<ProcessId>           ids;
        std::vector<std::optional<bool>> results;
        size_t                           pending = 0;
    };

    ProcessBackend& backend_;
    ExitSubscription subscription_;
    bool             started_ = false;

    std::unordered_set<ProcessId> tracked_;
    std::unordered_set<ProcessId> exited_;
    LivenessMap                   liveness_;

    std::unique_ptr<Batch> batch_;
    uint64_t               generation_ = 0;

    // Callbacks hold a weak reference; destruction or stop() invalidates it.
    std::shared_ptr<ProcessLivenessTracker*> token_;

    ChangeCallback on_change_;

    void start_batch();
    void on_probe_result(uint64_t generation, size_t index, bool alive);
    void commit(Batch& batch);
    void on_exit(const ProcessId& id);
    void notify();
};

}   // namespace termdeck
