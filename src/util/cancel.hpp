#pragma once
#include <atomic>
#include <csignal>

namespace gsynth {

// Cooperative stop flag polled by generators between edge attempts.
class cancel_token {
public:
    void request() noexcept { flag_.store(true, std::memory_order_relaxed); }
    bool requested() const noexcept { return flag_.load(std::memory_order_relaxed); }
    void reset() noexcept { flag_.store(false, std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

namespace detail {
inline cancel_token* g_interrupt_target = nullptr;

inline void on_interrupt(int) {
    if (g_interrupt_target) g_interrupt_target->request();
}
}

// Routes SIGINT/SIGTERM to `token` while in scope; restores the default
// handlers on destruction. Declare it after the token it points at.
class interrupt_scope {
public:
    explicit interrupt_scope(cancel_token& token) {
        detail::g_interrupt_target = &token;
        prev_int_ = std::signal(SIGINT, detail::on_interrupt);
        prev_term_ = std::signal(SIGTERM, detail::on_interrupt);
    }
    ~interrupt_scope() {
        std::signal(SIGINT, prev_int_ == SIG_ERR ? SIG_DFL : prev_int_);
        std::signal(SIGTERM, prev_term_ == SIG_ERR ? SIG_DFL : prev_term_);
        detail::g_interrupt_target = nullptr;
    }
    interrupt_scope(const interrupt_scope&) = delete;
    interrupt_scope& operator=(const interrupt_scope&) = delete;

private:
    void (*prev_int_)(int) = SIG_DFL;
    void (*prev_term_)(int) = SIG_DFL;
};

}
