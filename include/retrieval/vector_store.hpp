// File: retrieval/vector_store.hpp

#ifndef VECTOR_STORE_HPP
#define VECTOR_STORE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "types/category.hpp"
#include "types/feature_vector.hpp"
#include "types/image_record.hpp"

namespace retrieval {

    struct RecordMetadata {
        types::Category category;
        std::string source;
    };

    struct StoreMatch {
        std::shared_ptr<const types::ImageRecord> record;
        double distance{};
    };

    /*
     * Content-addressable vector store collaborator. Implementations own the records they hold
     * and may throw any std::exception on backend failure; callers translate those failures.
     * query() returns at most k matches ordered by ascending Euclidean distance.
     */
    class VectorStore {
    public:
        virtual ~VectorStore() = default;

        // Insert or replace the record keyed by id.
        virtual void upsert(const std::string &id, const types::FeatureVector &vector,
                            const RecordMetadata &metadata) = 0;

        [[nodiscard]] virtual std::vector<StoreMatch> query(const types::FeatureVector &vector,
                                                            std::size_t k) const = 0;

        [[nodiscard]] virtual std::size_t size() const = 0;

        virtual bool remove(const std::string &id) = 0;

        virtual void clear() = 0;

        [[nodiscard]] virtual std::map<types::Category, std::size_t> categoryCounts() const = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    };

} // namespace retrieval

#endif // VECTOR_STORE_HPP
