// include/thread_pool.hpp
#pragma once

#include <condition_variable>
#include <deque>
#include <functional> // For std::function
#include <future>     // For std::future, std::packaged_task
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept> // For std::runtime_error
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace GlacierUpload {
namespace Concurrency {

// Worker threads shared by every upload job. Each task is tagged with the job it
// belongs to and at most `per_job_limit` tasks of one job run at the same time,
// so a large job leaves workers free for the others. Tasks that have not started
// yet can be dropped per job.
class ThreadPool {
public:
    ThreadPool(size_t num_threads, size_t per_job_limit, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task for job_id. Exceptions thrown by the task are delivered
    // through the future; a dropped task's future reports broken_promise.
    template<class F>
    auto submit(const std::string& job_id, F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Discard the queued, not yet started tasks of job_id. Returns how many.
    size_t dropQueued(const std::string& job_id);

    size_t running(const std::string& job_id) const;
    size_t queued(const std::string& job_id) const;

    size_t size() const { return workers.size(); }
    size_t perJobLimit() const { return per_job_limit; }

private:
    struct Task {
        std::string job_id;
        std::function<void()> run;
    };

    // Oldest queued task whose job is below the limit. Caller holds queue_mutex.
    std::deque<Task>::iterator nextRunnable();

    void workerLoop();

    std::string name;
    size_t per_job_limit;
    std::vector<std::thread> workers;
    std::deque<Task> tasks;
    std::map<std::string, size_t> active; // Running tasks per job

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    bool stopping; // Set by the destructor; queued tasks still run before workers exit
};

template<class F>
auto ThreadPool::submit(const std::string& job_id, F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    // std::function needs a copyable target, so the packaged_task lives on the heap
    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> res = task->get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping)
            throw std::runtime_error("submit on stopped ThreadPool " + name);
        tasks.push_back(Task{job_id, [task]() { (*task)(); }});
    }
    condition.notify_all();
    return res;
}

} // namespace Concurrency
} // namespace GlacierUpload
