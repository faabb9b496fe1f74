// File: retrieval/in_memory_vector_store.cpp

#include "retrieval/in_memory_vector_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace retrieval {

    void InMemoryVectorStore::upsert(const std::string &id, const types::FeatureVector &vector,
                                     const RecordMetadata &metadata) {
        if (id.empty()) {
            throw std::invalid_argument("Record identifier must not be empty");
        }

        std::shared_ptr<const types::ImageRecord> record =
                std::make_shared<types::ImageRecord>(id, metadata.category, vector, metadata.source);

        std::unique_lock lock(mutex_);
        const bool inserted = records_.insert_or_assign(id, std::move(record)).second;
        LOG_TRACE("{} record '{}' ({})", inserted ? "Inserted" : "Replaced", id, metadata.category);
    }

    std::vector<StoreMatch> InMemoryVectorStore::query(const types::FeatureVector &vector, const std::size_t k) const {
        std::shared_lock lock(mutex_);

        std::vector<StoreMatch> matches;
        matches.reserve(records_.size());
        for (const auto &[id, record]: records_) {
            matches.push_back({record, vector.distance(record->features())});
        }

        const auto count = std::min(k, matches.size());
        const auto by_distance = [](const StoreMatch &a, const StoreMatch &b) {
            if (a.distance != b.distance) {
                return a.distance < b.distance;
            }
            return a.record->id() < b.record->id();
        };
        std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(count), matches.end(),
                          by_distance);
        matches.resize(count);
        return matches;
    }

    std::size_t InMemoryVectorStore::size() const {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    bool InMemoryVectorStore::remove(const std::string &id) {
        std::unique_lock lock(mutex_);
        return records_.erase(id) > 0;
    }

    void InMemoryVectorStore::clear() {
        std::unique_lock lock(mutex_);
        records_.clear();
        LOG_INFO("In-memory vector store cleared");
    }

    std::map<types::Category, std::size_t> InMemoryVectorStore::categoryCounts() const {
        std::shared_lock lock(mutex_);
        std::map<types::Category, std::size_t> counts;
        for (const auto &[id, record]: records_) {
            ++counts[record->category()];
        }
        return counts;
    }

} // namespace retrieval
