// File: common/errors.hpp

#ifndef COMMON_ERRORS_HPP
#define COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace common {

    // Input image is malformed: too small, too few channels, wrong depth or empty.
    class InvalidImageError : public std::invalid_argument {
    public:
        explicit InvalidImageError(const std::string &message) : std::invalid_argument(message) {}
    };

    // A similarity query was issued against a store holding no usable records.
    class EmptyIndexError : public std::runtime_error {
    public:
        explicit EmptyIndexError(const std::string &message) : std::runtime_error(message) {}
    };

    // The store holds records, but none is left once the queried item's own record is excluded.
    class NoNeighborsError : public EmptyIndexError {
    public:
        explicit NoNeighborsError(const std::string &message) : EmptyIndexError(message) {}
    };

    // The vector store backend failed an upsert or query. Never retried internally.
    class StorageError : public std::runtime_error {
    public:
        explicit StorageError(const std::string &message) : std::runtime_error(message) {}
    };

    // Feature extraction produced a non-finite value.
    class DegenerateFeatureError : public std::runtime_error {
    public:
        explicit DegenerateFeatureError(const std::string &message) : std::runtime_error(message) {}
    };

} // namespace common

#endif // COMMON_ERRORS_HPP
