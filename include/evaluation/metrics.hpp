// File: evaluation/metrics.hpp

#ifndef EVALUATION_METRICS_HPP
#define EVALUATION_METRICS_HPP

#include <cstddef>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include "types/category.hpp"

namespace evaluation {

    // Counts of (true category, predicted category) pairs over the sorted union of labels seen.
    class ConfusionMatrix {
    public:
        void add(const types::Category &truth, const types::Category &predicted);

        [[nodiscard]] std::size_t count(const types::Category &truth, const types::Category &predicted) const;
        [[nodiscard]] std::size_t total() const noexcept { return total_; }
        [[nodiscard]] std::size_t correct() const noexcept { return correct_; }
        [[nodiscard]] std::size_t support(const types::Category &truth) const;       // row sum
        [[nodiscard]] std::size_t predictions(const types::Category &predicted) const; // column sum
        [[nodiscard]] std::vector<types::Category> categories() const;
        [[nodiscard]] bool empty() const noexcept { return total_ == 0; }

        [[nodiscard]] double accuracy() const noexcept {
            return total_ == 0 ? 0.0 : static_cast<double>(correct_) / static_cast<double>(total_);
        }

    private:
        std::map<std::pair<types::Category, types::Category>, std::size_t> counts_;
        std::set<types::Category> categories_;
        std::size_t total_ = 0;
        std::size_t correct_ = 0;
    };

    struct ClassMetrics {
        types::Category category;
        double precision{};
        double recall{};
        double f1{};
        std::size_t support{};
        bool unsupported{}; // some ratio had a zero denominator and was reported as 0
    };

    struct AggregateMetrics {
        double accuracy{};
        double precision{}; // macro averages
        double recall{};
        double f1{};
        double weighted_precision{}; // weighted by true support
        double weighted_recall{};
        double weighted_f1{};
    };

    [[nodiscard]] std::vector<ClassMetrics> computeClassMetrics(const ConfusionMatrix &matrix);

    [[nodiscard]] AggregateMetrics computeAggregateMetrics(const ConfusionMatrix &matrix,
                                                           const std::vector<ClassMetrics> &per_class);

} // namespace evaluation

#endif // EVALUATION_METRICS_HPP
