#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include "spinner_state.hpp"

// Redraws "<glyph> <message>" in place on one terminal line from a
// background thread. At most one render thread exists at a time.
// Not thread-safe on its own: start/stop/update_message are expected to be
// serialized by the owner (OutputConsole).
class Spinner {
public:
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{100};

    explicit Spinner(std::ostream& out, std::chrono::milliseconds interval = DEFAULT_INTERVAL);
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void start(std::string_view message);
    // Blocks until the render thread has erased its line and exited.
    // Rethrows a write failure captured by the render thread.
    void stop();
    void update_message(std::string_view message);

    bool active() const;
    std::string message() const;
    std::size_t frame() const;
    int live_loops() const { return live_loops_; }

    static std::size_t glyph_count();

private:
    void render_loop();
    void erase_line();
    void shutdown();

    std::ostream& out_;
    std::chrono::milliseconds interval_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    SpinnerState state_;
    std::thread thread_;
    std::exception_ptr error_;
    std::atomic<int> live_loops_{0};
};
