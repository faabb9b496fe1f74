// File: common/io/dataset.cpp

#include "common/io/dataset.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace common::io {

    std::vector<DatasetEntry> listDataset(const std::filesystem::path &root) {
        if (!directoryExists(root.string())) {
            LOG_ERROR("Dataset root '{}' is not a directory.", root.string());
            throw std::runtime_error(fmt::format("Dataset root '{}' is not a directory", root.string()));
        }

        std::vector<std::filesystem::path> category_dirs;
        try {
            for (const auto &entry: std::filesystem::directory_iterator(root)) {
                if (entry.is_directory() && !entry.path().filename().string().starts_with(".")) {
                    category_dirs.push_back(entry.path());
                }
            }
        } catch (const std::filesystem::filesystem_error &e) {
            LOG_ERROR("Filesystem error: {}", e.what());
            throw std::runtime_error(fmt::format("Could not list dataset root '{}'", root.string()));
        }
        std::ranges::sort(category_dirs);

        std::vector<DatasetEntry> entries;
        for (const auto &dir: category_dirs) {
            const std::string label = dir.filename().string();
            const auto files = listFiles(dir, {".jpg", ".jpeg", ".png"});
            LOG_DEBUG("Category '{}': {} image(s).", label, files.size());
            for (const auto &file: files) {
                entries.push_back({label + "/" + file.filename().string(), types::Category(label), file});
            }
        }

        if (entries.empty()) {
            LOG_WARN("Dataset root '{}' holds no images.", root.string());
        }
        return entries;
    }

    std::filesystem::path canonicalPath(const std::filesystem::path &path) {
        std::error_code error;
        auto canonical = std::filesystem::weakly_canonical(path, error);
        if (error) {
            LOG_DEBUG("Could not canonicalize '{}': {}", path.string(), error.message());
            canonical = std::filesystem::absolute(path, error).lexically_normal();
            if (error) {
                return path.lexically_normal();
            }
        }
        return canonical;
    }

    std::string sampleId(const DatasetEntry &entry, const IndexedPaths &indexed) {
        if (const auto it = indexed.find(canonicalPath(entry.path)); it != indexed.end()) {
            return it->second;
        }
        return "test:" + entry.id;
    }

} // namespace common::io
