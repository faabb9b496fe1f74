// File: types/image_record.hpp

#ifndef TYPES_IMAGE_RECORD_HPP
#define TYPES_IMAGE_RECORD_HPP

#include <string>
#include <utility>

#include "types/category.hpp"
#include "types/feature_vector.hpp"

namespace types {

    // Immutable reference-corpus entry. Once indexed, the vector store owns it.
    class ImageRecord {
    public:
        ImageRecord(std::string id, Category category, FeatureVector features, std::string source = {}) :
            id_(std::move(id)), category_(std::move(category)), features_(std::move(features)),
            source_(std::move(source)) {}

        [[nodiscard]] const std::string &id() const noexcept { return id_; }
        [[nodiscard]] const Category &category() const noexcept { return category_; }
        [[nodiscard]] const FeatureVector &features() const noexcept { return features_; }
        [[nodiscard]] const std::string &source() const noexcept { return source_; }

    private:
        const std::string id_;
        const Category category_;
        const FeatureVector features_;
        const std::string source_;
    };

} // namespace types

#endif // TYPES_IMAGE_RECORD_HPP
