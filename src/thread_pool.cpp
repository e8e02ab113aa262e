#include "xLoad/thread_pool.h"

namespace xload {

ThreadPool::ThreadPool(size_t num_threads)
    : stop_(false), running_(0) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    job_cv_.notify_all();

    for (std::thread& worker : workers_) {
        worker.join();
    }
}

std::future<Status> ThreadPool::submit(Job job) {
    std::packaged_task<Status()> task(std::move(job));
    std::future<Status> result = task.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            std::promise<Status> rejected;
            rejected.set_value(Status(ErrorCode::ERR_UNAVAILABLE, "thread pool is stopped"));
            return rejected.get_future();
        }
        jobs_.push_back(std::move(task));
    }
    job_cv_.notify_one();
    return result;
}

size_t ThreadPool::runAll(std::vector<Job> jobs, std::vector<Status>& statuses) {
    std::vector<std::future<Status>> futures;
    futures.reserve(jobs.size());
    for (Job& job : jobs) {
        futures.push_back(submit(std::move(job)));
    }

    size_t first_failed = jobs.size();
    statuses.clear();
    statuses.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        statuses.push_back(futures[i].get());
        if (!statuses.back().ok() && first_failed == jobs.size()) {
            first_failed = i;
        }
    }
    return first_failed;
}

void ThreadPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && running_ == 0; });
}

void ThreadPool::workerLoop() {
    while (true) {
        std::packaged_task<Status()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_cv_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

            // Exit only once the queue is drained
            if (jobs_.empty()) {
                return;
            }
            task = std::move(jobs_.front());
            jobs_.pop_front();
            running_++;
        }

        task();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_--;
            if (jobs_.empty() && running_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

}  // namespace xload
