#pragma once

#include <atomic>

namespace devscout {
namespace runtime {

// SIGINT/SIGTERM set a flag that the main loop polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace devscout
