// src/thread_pool.cpp
#include "thread_pool.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace GlacierUpload
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads, size_t per_job_limit, std::string name)
            : name(std::move(name)), per_job_limit(per_job_limit), stopping(false)
        {
            if (num_threads == 0)
            {
                throw std::invalid_argument("ThreadPool " + this->name + " needs at least one thread");
            }
            if (per_job_limit == 0)
            {
                throw std::invalid_argument("ThreadPool " + this->name + " needs a per-job limit of at least one");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this]
                                     { workerLoop(); });
            }
            spdlog::debug("ThreadPool {} started with {} threads, {} per job", this->name, num_threads, per_job_limit);
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                stopping = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
            spdlog::debug("ThreadPool {} stopped", name);
        }

        std::deque<ThreadPool::Task>::iterator ThreadPool::nextRunnable()
        {
            return std::find_if(tasks.begin(), tasks.end(), [this](const Task &task)
                                {
                                    auto it = active.find(task.job_id);
                                    return it == active.end() || it->second < per_job_limit; });
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                Task task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    auto next = tasks.end();
                    condition.wait(lock, [this, &next]
                                   {
                                       next = nextRunnable();
                                       return next != tasks.end() || (stopping && tasks.empty()); });
                    if (next == tasks.end())
                    {
                        return;
                    }
                    task = std::move(*next);
                    tasks.erase(next);
                    ++active[task.job_id];
                }

                // packaged_task stores any exception in the future
                task.run();

                {
                    std::lock_guard<std::mutex> lock(queue_mutex);
                    auto it = active.find(task.job_id);
                    if (it != active.end() && --it->second == 0)
                    {
                        active.erase(it);
                    }
                }
                // A slot of this job opened up; tasks held back by the limit may run now
                condition.notify_all();
            }
        }

        size_t ThreadPool::dropQueued(const std::string &job_id)
        {
            std::vector<Task> dropped;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                for (auto it = tasks.begin(); it != tasks.end();)
                {
                    if (it->job_id == job_id)
                    {
                        dropped.push_back(std::move(*it));
                        it = tasks.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }
            // Destroying the packaged_tasks outside the lock breaks their promises
            const size_t count = dropped.size();
            dropped.clear();
            if (count > 0)
            {
                spdlog::debug("ThreadPool {}: dropped {} queued tasks of job {}", name, count, job_id);
            }
            return count;
        }

        size_t ThreadPool::running(const std::string &job_id) const
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            auto it = active.find(job_id);
            return it == active.end() ? 0 : it->second;
        }

        size_t ThreadPool::queued(const std::string &job_id) const
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(),
                                                     [&job_id](const Task &task)
                                                     { return task.job_id == job_id; }));
        }

    } // namespace Concurrency
} // namespace GlacierUpload
