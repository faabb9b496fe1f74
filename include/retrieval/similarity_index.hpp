// File: retrieval/similarity_index.hpp

#ifndef SIMILARITY_INDEX_HPP
#define SIMILARITY_INDEX_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string_view>

#include "config/configuration.hpp"
#include "retrieval/vector_store.hpp"
#include "types/image_record.hpp"
#include "types/neighbor_match.hpp"

namespace retrieval {

    /*
     * Adapter over a VectorStore. Indexing is an idempotent upsert keyed by record identifier;
     * queries return at most k matches by ascending Euclidean distance.
     *
     * Errors: backend failures surface as common::StorageError (never retried), querying a store
     * without usable records raises common::EmptyIndexError, and a non-empty store whose only
     * candidates are the excluded record raises its subclass common::NoNeighborsError.
     */
    class SimilarityIndexClient {
    public:
        struct Config {
            std::size_t k;

            Config() : k(config::get<std::size_t>("retrieval.k", 5)) {}
        };

        struct Stats {
            std::size_t total_records{};
            std::map<types::Category, std::size_t> categories;
        };

        explicit SimilarityIndexClient(std::shared_ptr<VectorStore> store, const Config &config = Config());

        virtual ~SimilarityIndexClient() = default;

        virtual void index(const types::ImageRecord &record);

        [[nodiscard]] virtual types::NeighborMatches query(const types::FeatureVector &vector, std::size_t k) const;

        // Same as query(), leaving out the record identified by exclude_id (leakage avoidance).
        [[nodiscard]] virtual types::NeighborMatches query(const types::FeatureVector &vector, std::size_t k,
                                                           std::string_view exclude_id) const;

        // Query with the configured default k.
        [[nodiscard]] types::NeighborMatches query(const types::FeatureVector &vector) const {
            return query(vector, config_.k);
        }

        [[nodiscard]] Stats stats() const;

        bool remove(const std::string &id);

        void clear();

        [[nodiscard]] std::size_t defaultK() const noexcept { return config_.k; }

    private:
        std::shared_ptr<VectorStore> store_;
        Config config_;

        [[nodiscard]] std::size_t storeSize() const;
    };

} // namespace retrieval

#endif // SIMILARITY_INDEX_HPP
