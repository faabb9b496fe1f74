// File: retrieval/in_memory_vector_store.hpp

#ifndef IN_MEMORY_VECTOR_STORE_HPP
#define IN_MEMORY_VECTOR_STORE_HPP

#include <map>
#include <shared_mutex>

#include "retrieval/vector_store.hpp"

namespace retrieval {

    /*
     * Brute-force store kept in process memory. Queries scan every record; ties on distance
     * are ordered by identifier so results are reproducible. Concurrent queries are safe,
     * writes take an exclusive lock.
     */
    class InMemoryVectorStore final : public VectorStore {
    public:
        InMemoryVectorStore() = default;

        void upsert(const std::string &id, const types::FeatureVector &vector,
                    const RecordMetadata &metadata) override;

        [[nodiscard]] std::vector<StoreMatch> query(const types::FeatureVector &vector,
                                                    std::size_t k) const override;

        [[nodiscard]] std::size_t size() const override;

        bool remove(const std::string &id) override;

        void clear() override;

        [[nodiscard]] std::map<types::Category, std::size_t> categoryCounts() const override;

        [[nodiscard]] std::string_view name() const noexcept override { return "in-memory"; }

    private:
        mutable std::shared_mutex mutex_;
        std::map<std::string, std::shared_ptr<const types::ImageRecord>> records_;
    };

} // namespace retrieval

#endif // IN_MEMORY_VECTOR_STORE_HPP
