// === Event Dispatcher ========================================================
//
// Fixed-size worker pool fed by a bounded blocking FIFO. Any worker may run any
// task; per-vehicle ordering is enforced by the state store, not by the
// dispatcher. A full queue blocks the submitter until a worker frees a slot.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "geofence_service/logging.hpp"

namespace geofence_service {

/** @brief Thread pool used to process inbound events concurrently. */
class EventDispatcher final {
  public:
    using Task = std::function<void()>;

    static constexpr std::size_t k_default_queue_capacity{1024};

    /** @throws std::invalid_argument if either size is zero. */
    explicit EventDispatcher(std::size_t worker_count, std::size_t queue_capacity = k_default_queue_capacity);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Enqueue @p task, blocking while the queue is full.
     *
     * @throws std::runtime_error after shutdown(), including when shutdown
     *         happens while the caller is blocked.
     */
    void submit(Task task);
    /** @brief Stop accepting work, drain the queue, and join every worker. */
    void shutdown();

    [[nodiscard]] std::size_t worker_count() const noexcept;
    [[nodiscard]] std::size_t queue_capacity() const noexcept;
    /** @brief Tasks queued but not yet picked up by a worker. */
    [[nodiscard]] std::size_t pending() const;

  private:
    /** @brief Pop and run tasks until shutdown and the queue is empty. */
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable condition_tasks_;
    std::condition_variable condition_space_;
    std::queue<Task> queue_tasks_;
    std::size_t queue_capacity_;
    bool flag_stopping_{false};
    std::vector<std::thread> list_workers_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geofence_service
