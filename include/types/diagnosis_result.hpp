// File: types/diagnosis_result.hpp

#ifndef TYPES_DIAGNOSIS_RESULT_HPP
#define TYPES_DIAGNOSIS_RESULT_HPP

#include <cstddef>
#include <string_view>
#include <vector>

#include "types/category.hpp"
#include "types/neighbor_match.hpp"

namespace types {

    enum class DiagnosisStatus { Reliable, Probable, Uncertain };

    [[nodiscard]] constexpr std::string_view toString(const DiagnosisStatus status) noexcept {
        switch (status) {
            case DiagnosisStatus::Reliable:
                return "reliable";
            case DiagnosisStatus::Probable:
                return "probable";
            case DiagnosisStatus::Uncertain:
                return "uncertain";
        }
        return "unknown";
    }

    struct CategoryVote {
        Category category;
        double weight{};     // summed inverse-distance weight
        double share{};      // weight / total weight, in [0, 1]
        std::size_t count{}; // neighbors carrying this category
    };

    struct DiagnosisResult {
        Category category;
        double confidence{}; // percentage in [0, 100]
        NeighborMatches neighbors;
        std::vector<CategoryVote> votes; // strongest first, ties by label
        double agreement{};              // fraction of neighbors whose category is the predicted one
        double nearest_distance{};
        double mean_distance{};
        double max_distance{};
        bool decided_by_tie_break{};
        DiagnosisStatus status{DiagnosisStatus::Uncertain};
    };

} // namespace types

template<>
struct fmt::formatter<types::DiagnosisStatus> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::DiagnosisStatus status, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(types::toString(status), ctx);
    }
};

#endif // TYPES_DIAGNOSIS_RESULT_HPP
