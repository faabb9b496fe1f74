// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include "common/formatting/fmt_eigen.hpp"

// NOTE: Logger MUST NOT depend on config::Configuration, as it will cause a circular dependency
namespace common::logging {

    /*
     * Process-wide logger writing to the console and to <directory>/<filename>. The first log line
     * creates it with default settings; configure() rebuilds the sinks once the configuration is known.
     */
    class Logger {
    public:
        struct Settings {
            std::string directory = "./logs";
            std::string filename = "leafscan.log";
            std::string level = "debug";
        };

        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                        Args &&...args);

        // Replace the sinks and level of the process logger. Call at startup, before worker threads log.
        static void configure(const Settings &settings);

        // Unknown names fall back to debug.
        [[nodiscard]] static spdlog::level::level_enum parseLevel(const std::string &level);

        [[nodiscard]] static Settings settings();

    private:
        static std::shared_ptr<spdlog::logger> logger_;
        static Settings settings_;
        static std::once_flag init_flag_;
        static std::mutex mutex_;

        static void ensureInitialized();

        static std::shared_ptr<spdlog::logger> build(const Settings &settings);
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(level, __FILE__, __LINE__, __FUNCTION__, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_(spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_(spdlog::level::critical, fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                     Args &&...args) {
        ensureInitialized();
        if (!logger_) {
            std::cerr << "Logger not initialized!" << std::endl;
            return;
        }
        const spdlog::source_loc source{file, line, func};
        if constexpr (sizeof...(args) > 0) {
            logger_->log(source, level, fmt::vformat(fmt, fmt::make_format_args(args...)));
        } else {
            logger_->log(source, level, fmt);
        }
    }

} // namespace common::logging

#endif // LOGGER_HPP
