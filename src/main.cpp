#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/cli.hpp"
#include "chunkrelay/core/utils.hpp"
#include "chunkrelay/core/command_registry.hpp"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_signal(int) {
    interrupted = 1;
}

}

int main(int argc, char* argv[]) {
    chunkrelay::core::CommandLineParser parser("chunkrelay");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n";
        std::cerr << "Run 'chunkrelay --help' for usage.\n";
        return 2;
    }

    if (parser.has_option("version")) {
        parser.print_version(std::cout);
        return 0;
    }

    auto& config = chunkrelay::core::Config::instance();
    config.set_defaults();

    auto config_file = chunkrelay::core::utils::FileUtils::expand_user(
        parser.get_option("config", "~/.chunkrelay.conf"));
    if (chunkrelay::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }
    config.load_from_environment();

    // Command line beats the environment, which beats the config file.
    if (auto chunk_size = parser.get_number_option("chunk-size")) {
        config.set("transfer.chunk_size", std::to_string(*chunk_size));
    }
    if (auto buffer_chunks = parser.get_number_option("buffer-chunks")) {
        config.set("transfer.buffer_chunks", std::to_string(*buffer_chunks));
    }
    if (auto timeout = parser.get_number_option("timeout")) {
        config.set("transfer.session_timeout_s", std::to_string(*timeout));
    }

    auto log_level = parser.has_option("verbose") ?
        chunkrelay::core::LogLevel::Debug :
        chunkrelay::core::Logger::parse_level(config.get_string("log.level", "info"));
    chunkrelay::core::Logger::initialize(config.get_string("log.file", "chunkrelay.log"), log_level);

    LOG_DEBUG("chunkrelay starting up");

    std::stop_source interrupt;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Signal handlers may only set a flag; this turns it into a stop request.
    std::jthread signal_watcher([&interrupt](std::stop_token watcher_stop) {
        while (!watcher_stop.stop_requested()) {
            if (interrupted) {
                LOG_WARN("Interrupted, cancelling");
                interrupt.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    chunkrelay::core::CommandContext context;
    context.quiet = parser.has_option("quiet");
    if (parser.has_option("digest")) {
        context.expected_digest = parser.get_option("digest");
    }
    auto delimiter = parser.get_option("delimiter", ",");
    context.delimiter = (delimiter == "\\t" || delimiter == "tab") ? '\t' : delimiter.empty() ? ',' : delimiter[0];
    context.has_header = !parser.has_option("no-header");
    context.rows = static_cast<size_t>(std::max<uint64_t>(1, parser.get_number_option("rows").value_or(20)));
    context.stop = interrupt.get_token();

    chunkrelay::core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty() || parser.has_option("help")) {
        parser.print_help(std::cout);
        command_registry.print_help(std::cout);
        chunkrelay::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cerr << "\n";
            command_registry.print_help(std::cerr);
        }
    }

    signal_watcher.request_stop();
    signal_watcher.join();
    chunkrelay::core::Logger::shutdown();

    return result.exit_code;
}
