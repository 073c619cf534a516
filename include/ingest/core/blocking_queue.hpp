/**
 * @file blocking_queue.hpp
 * @brief Unbounded FIFO with blocking take and an explicit stop sentinel
 *
 * WHY THIS FILE EXISTS:
 * Connects the folder watcher (producer) to the upload worker (consumer).
 * The consumer blocks in take() until a job arrives; a stop sentinel
 * releases it without pretending to be a job.
 *
 * EXAMPLE:
 * BlockingQueue<Job> queue;
 * queue.put(job);                // Producer
 * auto next = queue.take();      // Consumer (blocks)
 * if (!next) { return; }         // Sentinel -> leave the loop
 * ...
 * queue.task_done();
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace ingest {

/**
 * @brief Thread-safe FIFO queue with sentinel and completion accounting
 *
 * THREAD SAFETY:
 * - Multiple producers can put concurrently
 * - Multiple consumers can take concurrently
 * - Each sentinel releases exactly one take()
 *
 * Entries are stored as std::optional<T>; an empty optional is the sentinel.
 * Sentinels are never counted as unfinished work.
 */
template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    // Non-copyable
    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @brief Append an item
     *
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    void put(T item) {
        {
            std::unique_lock lock(mutex_);
            entries_.emplace_back(std::move(item));
            ++unfinished_;
        }
        available_.notify_one();
    }

    /**
     * @brief Append the stop sentinel
     *
     * Releases one consumer blocked in take(). Queued items ahead of the
     * sentinel are still delivered first.
     */
    void put_stop() {
        {
            std::unique_lock lock(mutex_);
            entries_.emplace_back(std::nullopt);
        }
        available_.notify_one();
    }

    /**
     * @brief Take the next entry (blocking)
     *
     * RETURNS: Item, or nullopt when the sentinel was dequeued
     * BLOCKS: Yes, until an entry is available
     */
    std::optional<T> take() {
        std::unique_lock lock(mutex_);
        available_.wait(lock, [this]() { return !entries_.empty(); });
        return pop_front_locked();
    }

    /**
     * @brief Take without blocking
     *
     * RETURNS: Item if available, nullopt if empty or sentinel
     */
    std::optional<T> try_take() {
        std::unique_lock lock(mutex_);
        if (entries_.empty()) {
            return std::nullopt;
        }
        return pop_front_locked();
    }

    /**
     * @brief Take with timeout
     *
     * RETURNS: Item if one arrived in time; nullopt on timeout or sentinel
     */
    template<typename Rep, typename Period>
    std::optional<T> take_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!available_.wait_for(lock, timeout, [this]() { return !entries_.empty(); })) {
            return std::nullopt;
        }
        return pop_front_locked();
    }

    /**
     * @brief Mark one previously taken item as fully processed
     */
    void task_done() {
        std::unique_lock lock(mutex_);
        if (unfinished_ > 0) {
            --unfinished_;
        }
        if (unfinished_ == 0) {
            drained_.notify_all();
        }
    }

    /**
     * @brief Block until every put() item has been acknowledged by task_done()
     */
    void join() {
        std::unique_lock lock(mutex_);
        drained_.wait(lock, [this]() { return unfinished_ == 0; });
    }

    template<typename Rep, typename Period>
    bool join_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        return drained_.wait_for(lock, timeout, [this]() { return unfinished_ == 0; });
    }

    /**
     * @brief Number of queued entries (sentinels included)
     */
    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return entries_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return entries_.empty();
    }

    std::size_t unfinished() const {
        std::unique_lock lock(mutex_);
        return unfinished_;
    }

private:
    std::optional<T> pop_front_locked() {
        std::optional<T> entry = std::move(entries_.front());
        entries_.pop_front();
        return entry;
    }

    std::deque<std::optional<T>> entries_;
    std::size_t unfinished_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::condition_variable drained_;
};

} // namespace ingest
