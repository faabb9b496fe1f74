// File: retrieval/similarity_index.cpp

#include "retrieval/similarity_index.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace retrieval {

    SimilarityIndexClient::SimilarityIndexClient(std::shared_ptr<VectorStore> store, const Config &config) :
        store_(std::move(store)), config_(config) {
        if (!store_) {
            throw std::invalid_argument("SimilarityIndexClient requires a vector store.");
        }
        if (config_.k == 0) {
            LOG_WARN("Configured neighbor count is 0, using 5.");
            config_.k = 5;
        }
        LOG_INFO("Similarity index over '{}' store, default k = {}", store_->name(), config_.k);
    }

    void SimilarityIndexClient::index(const types::ImageRecord &record) {
        try {
            store_->upsert(record.id(), record.features(), RecordMetadata{record.category(), record.source()});
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to index record '{}': {}", record.id(), e.what());
            throw common::StorageError(fmt::format("Failed to index record '{}': {}", record.id(), e.what()));
        }
        LOG_DEBUG("Indexed record '{}' as {}", record.id(), record.category());
    }

    types::NeighborMatches SimilarityIndexClient::query(const types::FeatureVector &vector,
                                                        const std::size_t k) const {
        return query(vector, k, {});
    }

    types::NeighborMatches SimilarityIndexClient::query(const types::FeatureVector &vector, const std::size_t k,
                                                        const std::string_view exclude_id) const {
        if (k == 0) {
            throw std::invalid_argument("Neighbor count k must be positive");
        }

        if (storeSize() == 0) {
            LOG_ERROR("Query against an empty '{}' store.", store_->name());
            throw common::EmptyIndexError("The similarity index holds no records");
        }

        // One extra candidate covers the excluded record
        const std::size_t requested = exclude_id.empty() ? k : k + 1;

        std::vector<StoreMatch> hits;
        try {
            hits = store_->query(vector, requested);
        } catch (const std::exception &e) {
            LOG_ERROR("Similarity query failed: {}", e.what());
            throw common::StorageError(fmt::format("Similarity query failed: {}", e.what()));
        }

        std::ranges::stable_sort(hits, {}, &StoreMatch::distance);

        bool excluded = false;
        types::NeighborMatches matches;
        matches.reserve(std::min(k, hits.size()));
        for (const auto &hit: hits) {
            if (matches.size() == k) {
                break;
            }
            if (!hit.record) {
                LOG_WARN("Store '{}' returned a match without a record, skipping it.", store_->name());
                continue;
            }
            if (!exclude_id.empty() && hit.record->id() == exclude_id) {
                excluded = true;
                continue;
            }
            matches.push_back({hit.record, hit.record->id(), hit.record->category(), hit.distance});
        }

        if (matches.empty()) {
            if (excluded) {
                LOG_ERROR("No records left after excluding '{}'.", exclude_id);
                throw common::NoNeighborsError(fmt::format("No records other than '{}' are indexed", exclude_id));
            }
            LOG_ERROR("Store '{}' returned no usable records.", store_->name());
            throw common::EmptyIndexError("The similarity index holds no usable records");
        }

        LOG_DEBUG("Query returned {} of {} requested neighbors (nearest {:.6f}).", matches.size(), k,
                  matches.front().distance);
        return matches;
    }

    SimilarityIndexClient::Stats SimilarityIndexClient::stats() const {
        try {
            return {store_->size(), store_->categoryCounts()};
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to read store statistics: {}", e.what());
            throw common::StorageError(fmt::format("Failed to read store statistics: {}", e.what()));
        }
    }

    bool SimilarityIndexClient::remove(const std::string &id) {
        try {
            return store_->remove(id);
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to remove record '{}': {}", id, e.what());
            throw common::StorageError(fmt::format("Failed to remove record '{}': {}", id, e.what()));
        }
    }

    void SimilarityIndexClient::clear() {
        try {
            store_->clear();
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to clear store: {}", e.what());
            throw common::StorageError(fmt::format("Failed to clear store: {}", e.what()));
        }
    }

    std::size_t SimilarityIndexClient::storeSize() const {
        try {
            return store_->size();
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to read store size: {}", e.what());
            throw common::StorageError(fmt::format("Failed to read store size: {}", e.what()));
        }
    }

} // namespace retrieval
