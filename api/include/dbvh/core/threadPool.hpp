#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <exception>

namespace dbvh {

enum class TaskPriority { HIGH, NORMAL, LOW };

/**
 * @brief Fixed set of workers, each with its own task deque.
 *
 * Tasks are distributed round-robin; an idle worker steals from the back of
 * the other queues. HIGH priority tasks go to the front of their queue.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t threadCount = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Queue a callable.
     * @return Future with the result (or the exception) of the call.
     * @throws std::runtime_error if the pool has been shut down.
     */
    template<typename Func, typename... Args>
    auto Submit(TaskPriority priority, Func&& f, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    /// Executa o que já está na fila e junta as threads. Idempotente.
    void Shutdown();

    size_t GetThreadCount() const noexcept { return m_workers.size(); }

private:
    void WorkerLoop(size_t index);
    bool tryPop(size_t index, std::function<void()>& task);
    bool trySteal(size_t thief, std::function<void()>& task);

private:
    std::vector<std::deque<std::function<void()>>> m_queues;
    std::vector<std::mutex> m_mutexes;
    std::vector<std::thread> m_workers;
    std::atomic_bool m_running{false};

    // Um único cv para acordar qualquer worker (inclusive os que roubam).
    // m_waitMutex é tomado antes de m_mutexes[i], nunca o contrário
    std::mutex m_waitMutex;
    std::condition_variable m_wakeup;
    std::atomic<size_t> m_pending{0};
    std::atomic<size_t> m_next{0};
};

// ---------------- Template Implementation ----------------

template<typename Func, typename... Args>
auto ThreadPool::Submit(TaskPriority priority, Func&& f, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>>
{
    using ReturnType = std::invoke_result_t<Func, Args...>;

    if (!m_running.load(std::memory_order_acquire))
        throw std::runtime_error("ThreadPool is shut down");

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<Func>(f), std::forward<Args>(args)...)
    );
    std::future<ReturnType> future = task->get_future();

    const size_t idx = m_next.fetch_add(1, std::memory_order_relaxed) % m_queues.size();
    {
        // Shutdown troca m_running sob m_waitMutex: ou a tarefa entra antes e é drenada, ou é recusada
        std::lock_guard<std::mutex> waitLock(m_waitMutex);
        if (!m_running.load(std::memory_order_acquire))
            throw std::runtime_error("ThreadPool is shut down");

        {
            std::lock_guard<std::mutex> lock(m_mutexes[idx]);
            if (priority == TaskPriority::HIGH)
                m_queues[idx].emplace_front([task]{ (*task)(); });
            else
                m_queues[idx].emplace_back([task]{ (*task)(); });
        }
        m_pending.fetch_add(1, std::memory_order_release);
    }
    m_wakeup.notify_one();
    return future;
}

/**
 * @brief Wait for every future, then collect the results.
 * @return Results in submission order (nothing for void futures).
 * @throws The first stored exception, only after all tasks have finished.
 */
template<typename T>
auto WaitAll(std::vector<std::future<T>>& futures)
{
    // Todas terminam antes de qualquer get(): as tarefas podem referenciar o escopo do chamador
    for (auto& f : futures) {
        if (f.valid())
            f.wait();
    }

    std::exception_ptr first;
    if constexpr (std::is_void_v<T>) {
        for (auto& f : futures) {
            try { f.get(); }
            catch (...) { if (!first) first = std::current_exception(); }
        }
        if (first)
            std::rethrow_exception(first);
    } else {
        std::vector<T> results;
        results.reserve(futures.size());
        for (auto& f : futures) {
            try { results.push_back(f.get()); }
            catch (...) { if (!first) first = std::current_exception(); }
        }
        if (first)
            std::rethrow_exception(first);
        return results;
    }
}

} // namespace dbvh
