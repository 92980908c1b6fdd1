#include "geofence_service/event_dispatcher.hpp"

#include <stdexcept>
#include <utility>

namespace geofence_service {

EventDispatcher::EventDispatcher(std::size_t worker_count, std::size_t queue_capacity)
    : queue_capacity_(queue_capacity),
      logger_(get_logger()) {
    if (worker_count == 0) {
        throw std::invalid_argument("EventDispatcher requires at least one worker");
    }
    if (queue_capacity == 0) {
        throw std::invalid_argument("EventDispatcher requires a non-zero queue capacity");
    }
    list_workers_.reserve(worker_count);
    for (std::size_t index = 0; index < worker_count; ++index) {
        list_workers_.emplace_back(&EventDispatcher::worker_loop, this);
    }
    logger_->info("Event dispatcher started with {} workers, queue capacity {}", worker_count, queue_capacity);
}

EventDispatcher::~EventDispatcher() {
    shutdown();
}

void EventDispatcher::submit(Task task) {
    {
        std::unique_lock lock(mutex_);
        if (!flag_stopping_ && queue_tasks_.size() >= queue_capacity_) {
            logger_->debug("Dispatcher queue full ({} tasks); blocking submitter", queue_tasks_.size());
        }
        condition_space_.wait(lock, [this]() { return flag_stopping_ || queue_tasks_.size() < queue_capacity_; });
        if (flag_stopping_) {
            throw std::runtime_error("EventDispatcher is shut down");
        }
        queue_tasks_.push(std::move(task));
    }
    condition_tasks_.notify_one();
}

void EventDispatcher::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        if (flag_stopping_) {
            return;
        }
        flag_stopping_ = true;
    }
    condition_tasks_.notify_all();
    condition_space_.notify_all();
    for (std::thread& worker : list_workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    logger_->info("Event dispatcher stopped");
}

std::size_t EventDispatcher::worker_count() const noexcept {
    return list_workers_.size();
}

std::size_t EventDispatcher::queue_capacity() const noexcept {
    return queue_capacity_;
}

std::size_t EventDispatcher::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_tasks_.size();
}

void EventDispatcher::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            condition_tasks_.wait(lock, [this]() { return flag_stopping_ || !queue_tasks_.empty(); });
            if (queue_tasks_.empty()) {
                return;
            }
            task = std::move(queue_tasks_.front());
            queue_tasks_.pop();
        }
        condition_space_.notify_one();
        try {
            task();
        } catch (const std::exception& exc) {
            logger_->error("Dispatcher task failed: {}", exc.what());
        }
    }
}

}  // namespace geofence_service
