#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rcat {

// Upper bound on worker threads picked automatically.
constexpr unsigned kMaxAutoThreads = 16;

// Fixed-size pool of threads draining a FIFO job queue.
// The destructor runs every queued job, then joins.
class WorkerPool {
public:
    explicit WorkerPool(unsigned threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> job);

    unsigned size() const { return static_cast<unsigned>(workers_.size()); }

    // `requested` when non-zero, else min(hardware concurrency, kMaxAutoThreads).
    static unsigned resolve_thread_count(unsigned requested);

private:
    void run();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace rcat
