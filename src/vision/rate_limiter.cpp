// ============= src/vision/rate_limiter.cpp =============
#include "rollcall/vision/rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace rollcall {

RateLimiter::RateLimiter(int max_requests, Clock::duration window)
    : max_requests(std::max(1, max_requests)), window(window) {}

void RateLimiter::prune(Clock::time_point now) {
    while (!requests.empty() && now - requests.front() >= window) {
        requests.pop_front();
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = Clock::now();
    prune(now);
    if (static_cast<int>(requests.size()) >= max_requests) return false;
    requests.push_back(now);
    return true;
}

RateLimiter::Clock::duration RateLimiter::wait_time() {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = Clock::now();
    prune(now);
    if (static_cast<int>(requests.size()) < max_requests) return Clock::duration::zero();
    return requests.front() + window - now;
}

void RateLimiter::acquire() {
    while (!try_acquire()) {
        auto wait = wait_time();
        if (wait <= Clock::duration::zero()) continue;

        spdlog::debug("RateLimiter: esperando {} ms",
                      std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
        std::this_thread::sleep_for(wait);
    }
}

int RateLimiter::in_window() {
    std::lock_guard<std::mutex> lock(mtx);
    prune(Clock::now());
    return static_cast<int>(requests.size());
}

} // namespace rollcall
