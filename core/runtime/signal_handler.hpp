#pragma once

#include <atomic>

namespace waypoint {
namespace runtime {

/**
 * @brief SIGINT/SIGTERM handling for graceful shutdown
 *
 * The handler only sets an atomic flag; Runtime::run() polls it. install()
 * remembers the dispositions it replaced so restore() can put them back.
 */
class SignalHandler {
public:
    static void install();
    static void restore();
    static bool is_installed();

    static bool is_shutdown_requested();

    // Same effect as receiving SIGTERM
    static void request_shutdown();

    // Clears the flag (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<bool> installed_;
};

}  // namespace runtime
}  // namespace waypoint
