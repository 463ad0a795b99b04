// ============= include/rollcall/registry/thread_pool.hpp =============
/*
 * Thread Pool
 *
 * CARACTERÍSTICAS:
 * - Cola con prioridad (mayor = mas urgente)
 * - submit() devuelve std::future (las excepciones viajan en el future)
 * - wait_all() bloquea hasta vaciar cola y tareas activas
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rollcall {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(int priority, F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
        return submit(0, std::forward<F>(f), std::forward<Args>(args)...);
    }

    size_t pending_tasks() const;
    size_t size() const { return workers.size(); }

    void wait_all();
    void stop();

private:
    struct Task {
        std::function<void()> func;
        int priority = 0;
        uint64_t sequence = 0;   // FIFO dentro de la misma prioridad

        bool operator<(const Task& other) const {
            if (priority != other.priority) return priority < other.priority;
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> workers;
    std::priority_queue<Task> tasks;
    uint64_t next_sequence = 0;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;
    bool stop_flag = false;
    size_t active_count = 0;

    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(int priority, F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks.push({[task]() { (*task)(); }, priority, next_sequence++});
    }

    condition.notify_one();
    return result;
}

} // namespace rollcall
