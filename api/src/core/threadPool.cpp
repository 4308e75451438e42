#include "dbvh/core/threadPool.hpp"
#include "dbvh/core/debug.hpp"

namespace dbvh {

ThreadPool::ThreadPool(size_t threadCount)
    : m_queues(threadCount == 0 ? 1 : threadCount),
      m_mutexes(threadCount == 0 ? 1 : threadCount)
{
    // hardware_concurrency() pode retornar 0
    const size_t count = m_queues.size();

    m_running.store(true, std::memory_order_release);
    m_workers.reserve(count);
    for (size_t i = 0; i < count; ++i)
        m_workers.emplace_back(&ThreadPool::WorkerLoop, this, i);

    DBVH_LOG_DEBUG("ThreadPool iniciado com {} threads.", count);
}

ThreadPool::~ThreadPool()
{
    Shutdown();
}

void ThreadPool::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;
    }
    m_wakeup.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable())
            worker.join();
    }

    // Tarefas enfileiradas durante o desligamento rodam aqui
    std::function<void()> task;
    for (size_t i = 0; i < m_queues.size(); ++i) {
        while (tryPop(i, task)) {
            m_pending.fetch_sub(1, std::memory_order_acq_rel);
            task();
        }
    }

    DBVH_LOG_DEBUG("ThreadPool finalizado.");
}

void ThreadPool::WorkerLoop(size_t index)
{
    std::function<void()> task;
    while (true) {
        if (tryPop(index, task) || trySteal(index, task)) {
            m_pending.fetch_sub(1, std::memory_order_acq_rel);
            task();     // packaged_task guarda a exceção no future
            task = nullptr;
            continue;
        }

        std::unique_lock<std::mutex> lock(m_waitMutex);
        m_wakeup.wait(lock, [this] {
            return m_pending.load(std::memory_order_acquire) > 0 || !m_running.load(std::memory_order_acquire);
        });

        if (!m_running.load(std::memory_order_acquire) && m_pending.load(std::memory_order_acquire) == 0)
            return;
    }
}

bool ThreadPool::tryPop(size_t index, std::function<void()>& task)
{
    std::lock_guard<std::mutex> lock(m_mutexes[index]);
    if (m_queues[index].empty())
        return false;

    task = std::move(m_queues[index].front());
    m_queues[index].pop_front();
    return true;
}

bool ThreadPool::trySteal(size_t thief, std::function<void()>& task)
{
    const size_t count = m_queues.size();
    for (size_t offset = 1; offset < count; ++offset) {
        const size_t victim = (thief + offset) % count;

        std::lock_guard<std::mutex> lock(m_mutexes[victim]);
        if (m_queues[victim].empty())
            continue;

        task = std::move(m_queues[victim].back());
        m_queues[victim].pop_back();
        return true;
    }
    return false;
}

} // namespace dbvh
