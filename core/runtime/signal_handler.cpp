#include "signal_handler.hpp"

#include <csignal>

#ifndef _WIN32
#include <signal.h>
#endif

namespace waypoint {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<bool> SignalHandler::installed_{false};

namespace {
#ifdef _WIN32
using SavedAction = void (*)(int);
constexpr int kSignals[] = {SIGINT, SIGTERM, SIGBREAK};
#else
using SavedAction = struct sigaction;
constexpr int kSignals[] = {SIGINT, SIGTERM};
#endif
constexpr int kSignalCount = sizeof(kSignals) / sizeof(kSignals[0]);

SavedAction previous[kSignalCount];
}  // namespace

void SignalHandler::install() {
    if (installed_.exchange(true)) {
        return;
    }

    for (int i = 0; i < kSignalCount; ++i) {
#ifdef _WIN32
        previous[i] = std::signal(kSignals[i], handle_signal);
#else
        struct sigaction action {};
        action.sa_handler = handle_signal;
        sigemptyset(&action.sa_mask);
        // Restart interrupted syscalls in httplib's worker threads
        action.sa_flags = SA_RESTART;
        sigaction(kSignals[i], &action, &previous[i]);
#endif
    }
}

void SignalHandler::restore() {
    if (!installed_.exchange(false)) {
        return;
    }

    for (int i = 0; i < kSignalCount; ++i) {
#ifdef _WIN32
        std::signal(kSignals[i], previous[i]);
#else
        sigaction(kSignals[i], &previous[i], nullptr);
#endif
    }
}

bool SignalHandler::is_installed() { return installed_.load(); }

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::request_shutdown() { shutdown_requested_.store(true); }

void SignalHandler::reset() { shutdown_requested_.store(false); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: only atomic operations allowed
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace waypoint
