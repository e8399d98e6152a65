#pragma once

#include <map>
#include <string>

struct Config {
    bool debug = false;
    int spinner_interval_ms = 100;
    std::string waiting_message = "Thinking...";

    static Config load_from_file(const std::string& path);
};

std::string trim(const std::string& s);
std::map<std::string, std::string> parse_config_file(const std::string& path);
