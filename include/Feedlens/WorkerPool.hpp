// =================================================================
// include/Feedlens/WorkerPool.hpp
// =================================================================
// Fixed-size worker pool used to run analysis batches concurrently.

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace Feedlens {

/**
 * @brief Bounded pool of worker threads fed from a FIFO task queue
 *
 * Tasks start in submission order. The destructor drains queued tasks
 * and joins every worker.
 */
class WorkerPool {
public:
    /**
     * @brief Start the workers
     * @param num_threads Worker count; 0 is treated as 1
     * @param name Pool name used in log messages
     */
    WorkerPool(size_t num_threads, const std::string& name);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<typename std::result_of<F(Args...)>::type> {
        using return_type = typename std::result_of<F(Args...)>::type;
        
        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        
        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            
            if (m_stop) {
                throw std::runtime_error("enqueue on stopped WorkerPool " + m_name);
            }
            
            m_tasks.emplace([task]() { (*task)(); });
        }
        
        m_condition.notify_one();
        return res;
    }

    size_t queueSize() const;
    size_t threadCount() const { return m_workers.size(); }
    const std::string& getName() const { return m_name; }

private:
    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_stop;
};

} // namespace Feedlens
