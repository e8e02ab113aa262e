#ifndef XLOAD_THREAD_POOL_H_
#define XLOAD_THREAD_POOL_H_

#include "status.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace xload {

// ============================================================================
// ThreadPool - fixed workers running Status-returning jobs
// ============================================================================

class ThreadPool {
public:
    using Job = std::function<Status()>;

    /// Constructor
    /// @param num_threads Number of worker threads (0 = hardware_concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// Destructor - drains the queue, then joins
    ~ThreadPool();

    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// Queue a job
    /// @return Future of the job status; ERR_UNAVAILABLE once the pool stops
    std::future<Status> submit(Job job);

    /// Run jobs in parallel and wait for all of them
    /// @param statuses Output: status of each job, in submission order
    /// @return Index of the first failed job, or jobs.size() if all succeeded
    size_t runAll(std::vector<Job> jobs, std::vector<Status>& statuses);

    /// Wait until the queue is empty and no job is running
    void waitIdle();

    size_t size() const { return workers_.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<Status()>> jobs_;

    std::mutex mutex_;
    std::condition_variable job_cv_;
    std::condition_variable idle_cv_;

    bool stop_;
    size_t running_;   // Jobs being executed, guarded by mutex_
};

}  // namespace xload

#endif  // XLOAD_THREAD_POOL_H_
