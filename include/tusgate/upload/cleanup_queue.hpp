#pragma once

#include "tusgate/core/context.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace tusgate {

class BackendSessionClient;

// Deletes retired backend objects on a background thread so finalize never
// waits on them. Deletion is best effort.
class CleanupQueue {
public:
    explicit CleanupQueue(BackendSessionClient& backend);
    ~CleanupQueue();

    CleanupQueue(const CleanupQueue&) = delete;
    CleanupQueue& operator=(const CleanupQueue&) = delete;

    void start();
    void stop();   // drains what is queued, then joins

    // Enqueues a delete; runs inline when the worker is not started
    void schedule(const RequestContext& ctx, const std::string& object_key);

    // Blocks until every scheduled delete has run
    void drain();

    uint64_t deletes_issued() const { return deletes_issued_.load(); }
    size_t pending() const;

private:
    struct Job {
        RequestContext ctx;
        std::string object_key;
    };

    void worker_loop();
    void run(const Job& job);

    BackendSessionClient& backend_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    size_t in_flight_ = 0;
    bool running_ = false;
    std::thread worker_;

    std::atomic<uint64_t> deletes_issued_{0};
};

} // namespace tusgate
