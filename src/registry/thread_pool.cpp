// ============= src/registry/thread_pool.cpp =============
#include "rollcall/registry/thread_pool.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    spdlog::info("Inicializando ThreadPool con {} threads", num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !tasks.empty();
            });

            if (stop_flag && tasks.empty()) {
                return;
            }

            task = tasks.top();
            tasks.pop();
            active_count++;   // bajo el lock: wait_all no ve un hueco
        }

        // packaged_task guarda la excepcion en el future
        task.func();

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_count--;
        }
        idle_condition.notify_all();
    }
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] {
        return tasks.empty() && active_count == 0;
    });
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop_flag = true;
    }

    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
}

} // namespace rollcall
