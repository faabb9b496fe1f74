// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace common::logging {

    namespace {
        constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%n] [%s:%# %!] %v";
        constexpr auto kName = "leafscan";
    } // namespace

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    Logger::Settings Logger::settings_;
    std::once_flag Logger::init_flag_;
    std::mutex Logger::mutex_;

    void Logger::ensureInitialized() {
        std::call_once(init_flag_, [] {
            std::lock_guard lock(mutex_);
            try {
                logger_ = build(settings_);
            } catch (const spdlog::spdlog_ex &ex) {
                std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            }
        });
    }

    std::shared_ptr<spdlog::logger> Logger::build(const Settings &settings) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        const std::filesystem::path path = std::filesystem::path(settings.directory) / settings.filename;
        try {
            std::filesystem::create_directories(settings.directory);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
        } catch (const std::exception &ex) {
            // Console logging stays available when the log directory is not writable.
            std::cerr << "Log file sink '" << path.string() << "' unavailable: " << ex.what() << std::endl;
        }

        auto logger = std::make_shared<spdlog::logger>(kName, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(settings.level));
        logger->set_pattern(kPattern);

        spdlog::drop(kName);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        return logger;
    }

    void Logger::configure(const Settings &settings) {
        ensureInitialized();
        std::lock_guard lock(mutex_);
        try {
            logger_ = build(settings);
            settings_ = settings;
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log reconfiguration failed, keeping the previous sinks: " << ex.what() << std::endl;
        }
    }

    spdlog::level::level_enum Logger::parseLevel(const std::string &level) {
        const auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            return spdlog::level::debug;
        }
        return parsed;
    }

    Logger::Settings Logger::settings() {
        std::lock_guard lock(mutex_);
        return settings_;
    }

} // namespace common::logging
