#include "tusgate/upload/cleanup_queue.hpp"
#include "tusgate/storage/session_client.hpp"
#include "tusgate/core/log.hpp"

namespace tusgate {

CleanupQueue::CleanupQueue(BackendSessionClient& backend) : backend_(backend) {}

CleanupQueue::~CleanupQueue() {
    stop();
}

void CleanupQueue::start() {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&CleanupQueue::worker_loop, this);
}

void CleanupQueue::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void CleanupQueue::schedule(const RequestContext& ctx, const std::string& object_key) {
    if (object_key.empty()) return;

    Job job{ctx, object_key};
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            jobs_.push_back(std::move(job));
            cv_.notify_one();
            return;
        }
    }
    run(job);
}

void CleanupQueue::drain() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && in_flight_ == 0; });
}

size_t CleanupQueue::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size() + in_flight_;
}

void CleanupQueue::run(const Job& job) {
    log_debug("deleting retired object %s", job.object_key.c_str());
    backend_.delete_object(job.ctx, job.object_key);
    deletes_issued_.fetch_add(1);
}

void CleanupQueue::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
            // Keep going after stop() until the queue is empty
            if (jobs_.empty()) break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++in_flight_;
        }

        run(job);

        {
            std::lock_guard lock(mutex_);
            --in_flight_;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace tusgate
