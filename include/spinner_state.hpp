#pragma once

#include <cstddef>
#include <string>
#include <thread>

// Mutated only under Spinner's state mutex.
struct SpinnerState {
    bool running = false;
    std::string message;
    std::size_t frame = 0;
    std::thread::id owner;
    bool interrupt_requested = false;

    bool active() const {
        return running && owner != std::thread::id();
    }

    void begin(const std::string& msg) {
        running = true;
        message = msg;
        frame = 0;
        interrupt_requested = false;
    }

    void reset() {
        running = false;
        owner = std::thread::id();
        interrupt_requested = false;
    }
};
