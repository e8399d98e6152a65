#include "spinner.hpp"
#include "colors.hpp"
#include <iostream>
#include <stdexcept>

namespace {

const char* const GLYPHS[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
constexpr std::size_t GLYPH_COUNT = sizeof(GLYPHS) / sizeof(GLYPHS[0]);

void check_stream(const std::ostream& out) {
    if (!out) {
        throw std::runtime_error("spinner: output stream is unusable");
    }
}

}

Spinner::Spinner(std::ostream& out, std::chrono::milliseconds interval)
    : out_(out), interval_(interval) {}

Spinner::~Spinner() {
    shutdown();
}

std::size_t Spinner::glyph_count() {
    return GLYPH_COUNT;
}

void Spinner::start(std::string_view message) {
    // Stopping -> Idle before Idle -> Running.
    stop();

    // The new thread blocks on mu_ until the state below is in place.
    std::lock_guard<std::mutex> lk(mu_);
    thread_ = std::thread(&Spinner::render_loop, this);
    state_.begin(std::string(message));
    state_.owner = thread_.get_id();
    ++live_loops_;
}

void Spinner::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!state_.running) return;
        state_.interrupt_requested = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lk(mu_);
        state_.reset();
        std::swap(error, error_);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void Spinner::update_message(std::string_view message) {
    std::lock_guard<std::mutex> lk(mu_);
    state_.message = std::string(message);
}

bool Spinner::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_.active();
}

std::string Spinner::message() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_.message;
}

std::size_t Spinner::frame() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_.frame;
}

void Spinner::render_loop() {
    std::unique_lock<std::mutex> lk(mu_);
    try {
        while (state_.running && !state_.interrupt_requested) {
            out_ << Colors::ERASE_LINE << Colors::SOFT_BLUE
                 << GLYPHS[state_.frame % GLYPH_COUNT] << " " << state_.message
                 << Colors::RESET << std::flush;
            check_stream(out_);
            state_.frame = (state_.frame + 1) % GLYPH_COUNT;

            // Releases mu_ while sleeping so stop() and update_message() get through.
            cv_.wait_for(lk, interval_, [this] { return state_.interrupt_requested; });
        }
        erase_line();
    } catch (...) {
        // Handed to the thread that calls stop().
        error_ = std::current_exception();
    }
    --live_loops_;
}

void Spinner::erase_line() {
    out_ << Colors::ERASE_LINE << std::flush;
    check_stream(out_);
}

void Spinner::shutdown() {
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "Warning: spinner failed while rendering: " << e.what() << std::endl;
    }
}
