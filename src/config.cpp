#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

constexpr int MIN_SPINNER_INTERVAL_MS = 10;
constexpr int MAX_SPINNER_INTERVAL_MS = 1000;

}

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::map<std::string, std::string> parse_config_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) return values;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            values[key] = value;
        }
    }
    return values;
}

Config Config::load_from_file(const std::string& path) {
    Config config;

    auto values = parse_config_file(path);
    if (values.count("debug")) config.debug = (values["debug"] == "true");
    if (values.count("waiting_message") && !values["waiting_message"].empty()) {
        config.waiting_message = values["waiting_message"];
    }
    if (values.count("spinner_interval_ms")) {
        int interval = std::stoi(values["spinner_interval_ms"]);
        if (interval < MIN_SPINNER_INTERVAL_MS || interval > MAX_SPINNER_INTERVAL_MS) {
            throw std::out_of_range("spinner_interval_ms must be between " +
                                    std::to_string(MIN_SPINNER_INTERVAL_MS) + " and " +
                                    std::to_string(MAX_SPINNER_INTERVAL_MS));
        }
        config.spinner_interval_ms = interval;
    }

    return config;
}
