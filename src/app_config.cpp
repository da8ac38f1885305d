#include "app_config.hpp"
#include <charconv>
#include <format>

namespace arbor {

std::vector<std::string> collect_args(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::optional<ConfigError> parse_args(const std::vector<std::string>& args, AppConfig& config) {
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--no-sample") {
            config.seed_sample = false;
        } else if (arg == "--log") {
            auto value = next_value();
            if (!value || value->empty()) {
                return ConfigError{"--log needs a file path"};
            }
            config.log_path = *value;
        } else if (arg == "--chrome") {
            auto value = next_value();
            if (!value) {
                return ConfigError{"--chrome needs a row count"};
            }
            int rows = 0;
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), rows);
            if (ec != std::errc{} || ptr != value->data() + value->size() || rows < 0) {
                return ConfigError{std::format("--chrome: '{}' is not a row count", *value)};
            }
            config.chrome_rows = rows;
        } else {
            return ConfigError{std::format("unknown option '{}'", arg)};
        }
    }
    return std::nullopt;
}

std::string usage(const std::string& program) {
    return std::format(
        "usage: {} [options]\n"
        "  --log <path>     write the log to <path> (default arbor.log)\n"
        "  --debug          log at debug level\n"
        "  --chrome <rows>  tree panel rows not counted in the list height (default 3)\n"
        "  --no-sample      start with an empty outline\n"
        "  -h, --help       show this help\n",
        program);
}

} // namespace arbor
