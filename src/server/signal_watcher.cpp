#include "server/signal_watcher.hpp"
#include "core/utils.hpp"

#include <pthread.h>

#include <format>

namespace reqlog {

namespace {

// Delivered by stop() to release sigwait() without triggering shutdown
constexpr int kWakeSignal = SIGUSR1;

sigset_t watched_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, kWakeSignal);
    return set;
}

} // anonymous namespace

void SignalWatcher::block_signals() {
    const sigset_t set = watched_signals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

SignalWatcher::SignalWatcher(Callback on_signal)
    : on_signal_(std::move(on_signal)),
      signals_(watched_signals()) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (started_) {
        return;
    }
    started_ = true;
    thread_ = std::thread(&SignalWatcher::watch, this);
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) {
        return;
    }
    pthread_kill(thread_.native_handle(), kWakeSignal);
    thread_.join();
}

void SignalWatcher::watch() {
    int signal = 0;
    if (sigwait(&signals_, &signal) != 0) {
        utils::log::error("Signal watcher: sigwait failed");
        return;
    }
    if (signal == kWakeSignal) {
        return;
    }

    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (on_signal_) {
        on_signal_(signal);
    }
}

} // namespace reqlog
