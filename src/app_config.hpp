#pragma once

#include <optional>
#include <string>
#include <vector>

namespace arbor {

struct AppConfig {
    std::string log_path = "arbor.log";
    bool debug = false;
    int chrome_rows = 3;  // Tree panel rows not counted in the window height
    bool seed_sample = true;
    bool show_help = false;
};

struct ConfigError {
    std::string message;
};

// Arguments after the program name; empty when argc < 2
[[nodiscard]] std::vector<std::string> collect_args(int argc, char* argv[]);

// Parses argv (without the program name). Returns the error for the first
// bad argument.
[[nodiscard]] std::optional<ConfigError> parse_args(const std::vector<std::string>& args, AppConfig& config);

[[nodiscard]] std::string usage(const std::string& program);

} // namespace arbor
