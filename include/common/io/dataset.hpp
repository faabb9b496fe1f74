// File: common/io/dataset.hpp

#ifndef COMMON_IO_DATASET_HPP
#define COMMON_IO_DATASET_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "types/category.hpp"

namespace common::io {

    struct DatasetEntry {
        std::string id; // "<category>/<file name>", unique within a dataset root
        types::Category category;
        std::filesystem::path path;
    };

    /**
     * @brief Lists a dataset laid out as one subdirectory per category holding .jpg, .jpeg and .png files.
     *
     * Entries are ordered by category then file name. Hidden directories are ignored.
     *
     * @throws std::runtime_error if the root is not a directory or cannot be listed.
     */
    [[nodiscard]] std::vector<DatasetEntry> listDataset(const std::filesystem::path &root);

    // Canonical form of a path that may not exist; falls back to the absolute, normalized path.
    [[nodiscard]] std::filesystem::path canonicalPath(const std::filesystem::path &path);

    // Canonical file path to the identifier it was indexed under.
    using IndexedPaths = std::map<std::filesystem::path, std::string>;

    /*
     * Identifier of an entry from a second dataset (e.g. a test split). A file that was also indexed
     * keeps its indexed identifier, so queries can exclude it; any other file gets "test:<id>" and
     * never collides with an indexed identifier.
     */
    [[nodiscard]] std::string sampleId(const DatasetEntry &entry, const IndexedPaths &indexed);

} // namespace common::io

#endif // COMMON_IO_DATASET_HPP
