// File: types/neighbor_match.hpp

#ifndef TYPES_NEIGHBOR_MATCH_HPP
#define TYPES_NEIGHBOR_MATCH_HPP

#include <memory>
#include <string>
#include <vector>

#include "types/category.hpp"
#include "types/image_record.hpp"

namespace types {

    /*
     * One similarity-query hit. The record is a non-owning back-reference into the store; the
     * identifier and category are value snapshots taken at query time so that a match stays
     * usable after the store drops the record.
     */
    struct NeighborMatch {
        std::weak_ptr<const ImageRecord> record;
        std::string id;
        Category category;
        double distance{};
    };

    using NeighborMatches = std::vector<NeighborMatch>;

} // namespace types

#endif // TYPES_NEIGHBOR_MATCH_HPP
