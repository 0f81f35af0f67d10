#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace termdeck
{

// Bounded ring buffer that carries collaborator completions from whatever
// thread reported them to the UI thread.
//
// Producers may be any number of backend threads; pushes are serialized by a
// lock. The UI thread is the single consumer and drains once per frame.
//
// push() is bounded and refuses commands when the ring is full. post() never
// refuses an open queue: once the ring is full it spills into an unbounded
// overflow list, and every later post goes there too until the next drain, so
// commands still run in the order they were posted.
//
// After close() every push and post is refused, so completions arriving once
// the owner is gone are released on the producer's thread instead of piling up.
class CommandQueue
{
   public:
    using Command = std::function<void()>;

    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit CommandQueue(size_t capacity = DEFAULT_CAPACITY)
        : slots_(capacity < 2 ? 2 : capacity), ring_(new Command[slots_])
    {
    }

    ~CommandQueue() { delete[] ring_; }

    CommandQueue(const CommandQueue&)            = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Producer side. False when the ring is full (or spilled) or the queue is
    // closed; a full ring also counts the command as dropped.
    bool push(Command cmd)
    {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        if (closed_.load(std::memory_order_acquire))
            return false;
        if (!overflow_.empty() || !push_ring(cmd))
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    // Producer side. Only a closed queue refuses the command. `spilled` is
    // set when the command went to the overflow list.
    bool post(Command cmd, bool* spilled = nullptr)
    {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        if (spilled)
            *spilled = false;
        if (closed_.load(std::memory_order_acquire))
            return false;
        if (overflow_.empty() && push_ring(cmd))
            return true;
        overflow_.push_back(std::move(cmd));
        overflowed_.fetch_add(1, std::memory_order_relaxed);
        if (spilled)
            *spilled = true;
        return true;
    }

    // Consumer side. Takes from the ring only. False when the ring is empty.
    bool pop(Command& out)
    {
        const size_t read = read_.load(std::memory_order_relaxed);
        if (read == write_.load(std::memory_order_acquire))
            return false;

        out         = std::move(ring_[read]);
        ring_[read] = nullptr;
        read_.store(advance(read), std::memory_order_release);
        return true;
    }

    // Consumer side: run what was queued when the call began, ring first and
    // then the overflow (everything in the overflow is newer). Anything queued
    // by the commands themselves waits for the next drain.
    size_t drain()
    {
        size_t              end = 0;
        std::deque<Command> spilled;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            end = write_.load(std::memory_order_acquire);
            spilled.swap(overflow_);
        }

        size_t  ran = 0;
        Command cmd;
        while (read_.load(std::memory_order_relaxed) != end && pop(cmd))
        {
            if (cmd)
                cmd();
            ++ran;
        }
        for (auto& late : spilled)
        {
            if (late)
                late();
            ++ran;
        }
        return ran;
    }

    // Consumer side: refuse further commands and release pending ones
    // without running them. Returns how many were released.
    size_t close()
    {
        std::deque<Command> spilled;
        {
            std::lock_guard<std::mutex> lock(producer_mutex_);
            closed_.store(true, std::memory_order_release);
            spilled.swap(overflow_);
        }
        size_t  released = spilled.size();
        Command cmd;
        while (pop(cmd))
            ++released;
        return released;
    }

    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    bool empty() const { return size() == 0; }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        const size_t                write = write_.load(std::memory_order_acquire);
        const size_t                read  = read_.load(std::memory_order_acquire);
        const size_t                ring  = write >= read ? write - read : slots_ - read + write;
        return ring + overflow_.size();
    }

    // Ring slots; one stays free to tell full from empty.
    size_t capacity() const { return slots_; }

    // push() calls refused for lack of room.
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    // post() calls that went to the overflow list.
    uint64_t overflowed() const { return overflowed_.load(std::memory_order_relaxed); }

   private:
    const size_t slots_;
    Command*     ring_;

    mutable std::mutex    producer_mutex_;
    std::deque<Command>   overflow_;
    std::atomic<bool>     closed_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> overflowed_{0};

    // Separate cache lines for the two ends.
    alignas(64) std::atomic<size_t> write_{0};
    alignas(64) std::atomic<size_t> read_{0};

    size_t advance(size_t i) const { return (i + 1) % slots_; }

    // Caller holds producer_mutex_. Leaves `cmd` untouched when full.
    bool push_ring(Command& cmd)
    {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t after = advance(write);
        if (after == read_.load(std::memory_order_acquire))
            return false;

        ring_[write] = std::move(cmd);
        write_.store(after, std::memory_order_release);
        return true;
    }
};

}   // namespace termdeck
