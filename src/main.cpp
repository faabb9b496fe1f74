// File: main.cpp

#include <charconv>
#include <cstring>
#include <string>
#include <string_view>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "executor.hpp"

namespace {
    constexpr std::string_view kUsage =
            "usage: leafscan <reference_dir> [--query <image> | --evaluate <test_dir>] [--config <file>] [--k N]";

    bool parseArguments(const int argc, char *argv[], Executor::Options &options, std::string &config_file) {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg(argv[i]);
            const bool has_value = i + 1 < argc;

            if (arg == "--query" && has_value) {
                options.query_image = argv[++i];
            } else if (arg == "--evaluate" && has_value) {
                options.test_dir = argv[++i];
            } else if (arg == "--config" && has_value) {
                config_file = argv[++i];
            } else if (arg == "--k" && has_value) {
                const char *value = argv[++i];
                std::size_t k = 0;
                const auto [end, error] = std::from_chars(value, value + std::strlen(value), k);
                if (error != std::errc() || *end != '\0' || k == 0) {
                    LOG_ERROR("--k expects a positive integer, got '{}'", value);
                    return false;
                }
                options.k = k;
            } else if (!arg.starts_with("--") && options.reference_dir.empty()) {
                options.reference_dir = arg;
            } else {
                LOG_ERROR("Unexpected argument '{}'", arg);
                return false;
            }
        }

        if (options.reference_dir.empty()) {
            LOG_ERROR("Missing reference directory.");
            return false;
        }
        if (options.query_image && options.test_dir) {
            LOG_ERROR("--query and --evaluate are mutually exclusive.");
            return false;
        }
        return true;
    }
} // namespace

int main(const int argc, char *argv[]) {
    Executor::Options options;
    std::string config_file;
    if (!parseArguments(argc, argv, options, config_file)) {
        LOG_INFO("{}", kUsage);
        return 1;
    }

    try {
        config::initialize(config_file);
    } catch (const std::exception &e) {
        LOG_CRITICAL("Could not load configuration: {}", e.what());
        return 1;
    }
    common::logging::Logger::Settings logging;
    logging.directory = config::get("logging.directory", logging.directory);
    logging.filename = config::get("logging.file", logging.filename);
    logging.level = config::get("logging.level", logging.level);
    common::logging::Logger::configure(logging);

    return Executor::execute(options);
}
