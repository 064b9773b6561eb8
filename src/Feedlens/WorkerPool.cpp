// =================================================================
// src/Feedlens/WorkerPool.cpp
// =================================================================

#include "Feedlens/WorkerPool.hpp"
#include "Feedlens/Logger.hpp"

namespace Feedlens {

WorkerPool::WorkerPool(size_t num_threads, const std::string& name)
    : m_name(name), m_stop(false) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(m_queue_mutex);
                    m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                    
                    if (m_stop && m_tasks.empty()) {
                        return;
                    }
                    
                    task = std::move(m_tasks.front());
                    m_tasks.pop();
                }
                
                // packaged_task stores any exception in its future
                task();
            }
        });
    }
    
    LOG_DEBUG("WorkerPool", "Started pool '" + m_name + "' with " + std::to_string(num_threads) + " workers");
}

WorkerPool::~WorkerPool() {
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        m_stop = true;
    }
    
    m_condition.notify_all();
    
    for (std::thread& worker : m_workers) {
        worker.join();
    }
}

size_t WorkerPool::queueSize() const {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    return m_tasks.size();
}

} // namespace Feedlens
