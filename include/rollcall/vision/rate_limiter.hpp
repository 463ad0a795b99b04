// ============= include/rollcall/vision/rate_limiter.hpp =============
#pragma once
#include <chrono>
#include <deque>
#include <mutex>

namespace rollcall {

// Ventana deslizante: como maximo max_requests dentro de window.
// acquire() bloquea hasta que expire la peticion mas antigua.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(int max_requests, Clock::duration window = std::chrono::minutes(1));

    void acquire();
    bool try_acquire();

    // Tiempo de espera para la siguiente peticion (0 si hay hueco)
    Clock::duration wait_time();

    int in_window();
    int get_max_requests() const { return max_requests; }

private:
    int max_requests;
    Clock::duration window;
    std::deque<Clock::time_point> requests;
    std::mutex mtx;

    void prune(Clock::time_point now);
};

} // namespace rollcall
