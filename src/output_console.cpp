#include "output_console.hpp"
#include "colors.hpp"
#include <stdexcept>

OutputConsole::OutputConsole(bool debug, std::ostream& out, std::chrono::milliseconds spinner_interval)
    : out_(out), debug_(debug), spinner_(out, spinner_interval) {}

void OutputConsole::output(const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);
    write_line(text);
}

void OutputConsole::debug_output(const std::string& text) {
    if (!debug_) return;

    std::lock_guard<std::mutex> lk(mu_);
    write_line(Colors::GRAY + text + Colors::RESET);
}

void OutputConsole::error_output(const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);
    write_line(Colors::RED + text + Colors::RESET);
}

void OutputConsole::start_waiting(const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    waiting_ = true;
    waiting_message_ = message;
    if (spinner_.active()) {
        spinner_.update_message(message);
    } else {
        spinner_.start(message);
    }
}

void OutputConsole::update_waiting(const std::string& message) {
    std::lock_guard<std::mutex> lk(mu_);
    waiting_message_ = message;
    if (spinner_.active()) {
        spinner_.update_message(message);
    }
}

void OutputConsole::stop_waiting() {
    std::lock_guard<std::mutex> lk(mu_);
    waiting_ = false;
    if (spinner_.active()) {
        spinner_.stop();
    }
}

bool OutputConsole::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return spinner_.active();
}

bool OutputConsole::waiting() const {
    std::lock_guard<std::mutex> lk(mu_);
    return waiting_;
}

// Caller holds mu_.
void OutputConsole::write_line(const std::string& line) {
    if (waiting_) {
        spinner_.stop();
    }

    out_ << line << std::endl;
    if (!out_) {
        throw std::runtime_error("console: output stream is unusable");
    }

    if (waiting_) {
        spinner_.start(waiting_message_);
    }
}
