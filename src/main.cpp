#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "output_console.hpp"

std::string get_config_path() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string config_dir;
    if (xdg_config && strlen(xdg_config) > 0) {
        config_dir = xdg_config;
    } else {
        const char* home = std::getenv("HOME");
        if (!home || strlen(home) == 0) {
            throw std::runtime_error("HOME environment variable not set");
        }
        config_dir = std::string(home) + "/.config";
    }
    return config_dir + "/nuconsole/config.txt";
}

void run_worker(OutputConsole& console, int id, int lines, int duration_ms, std::atomic<int>& done) {
    std::mt19937 rng(static_cast<unsigned>(id) * 7919u + 1u);
    std::uniform_int_distribution<int> delay(0, std::max(1, duration_ms / std::max(1, lines)));
    const std::string tag = "[worker " + std::to_string(id) + "] ";

    for (int i = 0; i < lines; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay(rng)));
        console.debug_output(tag + "step " + std::to_string(i) + " starting");
        if (i % 4 == 3) {
            console.error_output(tag + "step " + std::to_string(i) + " reported a problem");
        } else {
            console.output(tag + "step " + std::to_string(i) + " finished");
        }
    }
    ++done;
}

int main(int argc, char** argv) {
    CLI::App app{"nuconsole - Serialized console output around a waiting spinner"};

    bool debug = false;
    int workers = 4;
    int lines = 5;
    int duration_ms = 2000;
    int interval_ms = 0;
    std::string message;
    std::string config_path;

    app.set_help_flag("--help", "Print help message");
    app.add_flag("-d,--debug", debug, "Show debug output");
    app.add_option("--config", config_path, "Path to config file");
    app.add_option("-w,--workers", workers, "Number of threads writing output")->check(CLI::Range(1, 64));
    app.add_option("-l,--lines", lines, "Lines written by each worker")->check(CLI::Range(1, 1000));
    app.add_option("--duration-ms", duration_ms, "Approximate run time in milliseconds")->check(CLI::Range(0, 600000));
    app.add_option("--interval-ms", interval_ms, "Spinner frame interval in milliseconds")->check(CLI::Range(10, 1000));
    app.add_option("-m,--message", message, "Spinner message");

    CLI11_PARSE(app, argc, argv);

    try {
        if (config_path.empty()) {
            config_path = get_config_path();
        }
        Config config = Config::load_from_file(config_path);
        if (debug) config.debug = true;
        if (interval_ms > 0) config.spinner_interval_ms = interval_ms;
        if (!message.empty()) config.waiting_message = message;

        OutputConsole console(config.debug, std::cout, std::chrono::milliseconds(config.spinner_interval_ms));
        console.debug_output("Loaded configuration from " + config_path);

        std::atomic<int> done{0};
        auto start = std::chrono::steady_clock::now();

        console.start_waiting(config.waiting_message);
        std::vector<std::thread> threads;
        for (int id = 0; id < workers; ++id) {
            threads.emplace_back(run_worker, std::ref(console), id, lines, duration_ms, std::ref(done));
        }

        int reported = -1;
        while (done < workers) {
            int finished = done;
            if (finished != reported) {
                console.update_waiting(config.waiting_message + " (" + std::to_string(finished) + "/" +
                                       std::to_string(workers) + " workers done)");
                reported = finished;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        for (auto& t : threads) {
            t.join();
        }
        console.stop_waiting();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        console.output("Done: " + std::to_string(workers * lines) + " lines from " + std::to_string(workers) +
                       " workers in " + std::to_string(elapsed) + " ms");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
