#pragma once

#include <csignal>
#include <functional>
#include <thread>

namespace reqlog {

/**
 * @brief Waits for SIGINT/SIGTERM on a dedicated thread
 *
 * block_signals() must run in main before any other thread is created
 * so every thread inherits the blocked mask; the watcher thread then
 * receives the signal through sigwait() and runs the callback in normal
 * thread context (no async-signal-safety restrictions).
 */
class SignalWatcher {
public:
    using Callback = std::function<void(int)>;

    /// Block SIGINT and SIGTERM in the calling thread (and its children)
    static void block_signals();

    explicit SignalWatcher(Callback on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();

    /// Wake the watcher without a real signal (used on normal exit)
    void stop();

private:
    void watch();

    Callback on_signal_;
    std::thread thread_;
    sigset_t signals_{};
    bool started_ = false;
};

} // namespace reqlog
