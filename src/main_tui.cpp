#include "app_config.hpp"
#include "outline/outline.hpp"
#include "tree_flattener.hpp"
#include "tui/tui_app.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <memory>

namespace {

// The terminal belongs to curses, so the log goes to a file
bool init_logging(const arbor::AppConfig& config) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path, true);
        auto log = std::make_shared<spdlog::logger>("arbor", std::move(sink));
        const auto level = config.debug ? spdlog::level::debug : spdlog::level::info;
        log->set_level(level);
        log->flush_on(level);

        spdlog::set_default_logger(std::move(log));
        spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: cannot open log " << config.log_path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "arbor";

    arbor::AppConfig config;
    if (auto error = arbor::parse_args(arbor::collect_args(argc, argv), config)) {
        std::cerr << "Error: " << error->message << "\n" << arbor::usage(program);
        return 2;
    }
    if (config.show_help) {
        std::cout << arbor::usage(program);
        return 0;
    }

    if (!init_logging(config)) {
        return 1;
    }

    try {
        // The outline is owned here; TuiApp only borrows it
        auto outline = config.seed_sample ? arbor::outline::Outline::sample()
                                          : std::make_unique<arbor::outline::Outline>();
        spdlog::info("outline ready: {} nodes", outline->size());

        arbor::TuiApp app(outline.get(),
                          arbor::full_tree_strategy(arbor::outline::OutlineNode::field_names()),
                          config);
        app.run();
        return 0;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        endwin();
        spdlog::critical("fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
