#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include "spinner.hpp"

// Serializes every write to the terminal and owns the "waiting" spinner.
// Each public operation holds one mutex from start to finish, so writes from
// concurrent callers never split or merge. While waiting, a write pauses the
// spinner (erasing its line), prints, then resumes it.
class OutputConsole {
public:
    static constexpr const char* DEFAULT_WAITING_MESSAGE = "Thinking...";

    explicit OutputConsole(bool debug = false,
                           std::ostream& out = std::cout,
                           std::chrono::milliseconds spinner_interval = Spinner::DEFAULT_INTERVAL);

    OutputConsole(const OutputConsole&) = delete;
    OutputConsole& operator=(const OutputConsole&) = delete;

    void output(const std::string& text);
    void debug_output(const std::string& text);
    void error_output(const std::string& text);

    void start_waiting(const std::string& message = DEFAULT_WAITING_MESSAGE);
    void update_waiting(const std::string& message);
    void stop_waiting();

    bool active() const;
    bool waiting() const;

    bool debug_enabled() const { return debug_; }
    void set_debug(bool enabled) { debug_ = enabled; }

private:
    void write_line(const std::string& line);

    std::ostream& out_;
    std::atomic<bool> debug_;
    mutable std::mutex mu_;
    bool waiting_ = false;
    std::string waiting_message_;
    Spinner spinner_;
};
