// File: common/io/io.hpp

#ifndef IO_HPP
#define IO_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "common/logging/logger.hpp"

namespace common::io {

    /**
     * @brief Checks if a file exists and can be opened for reading.
     */
    inline bool fileExists(std::string_view file_path) {
        if (const std::filesystem::path path(file_path); std::ifstream(path).good()) {
            LOG_TRACE("File exists: {}", file_path);
            return true;
        }

        LOG_DEBUG("File does not exist: {}", file_path);
        return false;
    }

    /**
     * @brief Checks if a directory exists.
     */
    inline bool directoryExists(std::string_view dir_path) {
        std::error_code error;
        if (const std::filesystem::path path(dir_path); is_directory(path, error)) {
            LOG_TRACE("Directory exists: {}", dir_path);
            return true;
        }

        LOG_DEBUG("Directory does not exist: {}", dir_path);
        return false;
    }

    /**
     * @brief Case-insensitive extension check, e.g. hasExtension("a/B.JPG", {".jpg"}) is true.
     */
    inline bool hasExtension(const std::filesystem::path &path, const std::initializer_list<std::string_view> extensions) {
        std::string extension = path.extension().string();
        std::ranges::transform(extension, extension.begin(), [](const unsigned char c) { return std::tolower(c); });
        return std::ranges::find(extensions, extension) != extensions.end();
    }

    /**
     * @brief Lists the regular files directly inside a directory whose extension matches, sorted by path.
     *
     * @throws std::runtime_error if the directory cannot be iterated.
     */
    inline std::vector<std::filesystem::path> listFiles(const std::filesystem::path &dir_path,
                                                        const std::initializer_list<std::string_view> extensions) {
        std::vector<std::filesystem::path> files;
        try {
            for (const auto &entry: std::filesystem::directory_iterator(dir_path)) {
                if (entry.is_regular_file() && hasExtension(entry.path(), extensions)) {
                    files.push_back(entry.path());
                }
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not list directory: {}", dir_path.string()));
        }
        std::ranges::sort(files);
        return files;
    }

} // namespace common::io

#endif // IO_HPP
