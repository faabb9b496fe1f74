// File: evaluation/metrics.cpp

#include "evaluation/metrics.hpp"

namespace evaluation {

    void ConfusionMatrix::add(const types::Category &truth, const types::Category &predicted) {
        ++counts_[{truth, predicted}];
        categories_.insert(truth);
        categories_.insert(predicted);
        ++total_;
        if (truth == predicted) {
            ++correct_;
        }
    }

    std::size_t ConfusionMatrix::count(const types::Category &truth, const types::Category &predicted) const {
        const auto it = counts_.find({truth, predicted});
        return it == counts_.end() ? 0 : it->second;
    }

    std::size_t ConfusionMatrix::support(const types::Category &truth) const {
        std::size_t sum = 0;
        for (const auto &[key, value]: counts_) {
            if (key.first == truth) {
                sum += value;
            }
        }
        return sum;
    }

    std::size_t ConfusionMatrix::predictions(const types::Category &predicted) const {
        std::size_t sum = 0;
        for (const auto &[key, value]: counts_) {
            if (key.second == predicted) {
                sum += value;
            }
        }
        return sum;
    }

    std::vector<types::Category> ConfusionMatrix::categories() const {
        return {categories_.begin(), categories_.end()};
    }

    std::vector<ClassMetrics> computeClassMetrics(const ConfusionMatrix &matrix) {
        std::vector<ClassMetrics> metrics;
        for (const auto &category: matrix.categories()) {
            const auto true_positives = static_cast<double>(matrix.count(category, category));
            const std::size_t predicted = matrix.predictions(category);
            const std::size_t actual = matrix.support(category);

            ClassMetrics entry{category};
            entry.support = actual;

            if (predicted == 0) {
                entry.unsupported = true;
            } else {
                entry.precision = true_positives / static_cast<double>(predicted);
            }
            if (actual == 0) {
                entry.unsupported = true;
            } else {
                entry.recall = true_positives / static_cast<double>(actual);
            }
            if (entry.precision + entry.recall > 0.0) {
                entry.f1 = 2.0 * entry.precision * entry.recall / (entry.precision + entry.recall);
            } else {
                entry.unsupported = true;
            }
            metrics.push_back(entry);
        }
        return metrics;
    }

    AggregateMetrics computeAggregateMetrics(const ConfusionMatrix &matrix, const std::vector<ClassMetrics> &per_class) {
        AggregateMetrics aggregate;
        aggregate.accuracy = matrix.accuracy();
        if (per_class.empty()) {
            return aggregate;
        }

        double total_support = 0.0;
        for (const auto &entry: per_class) {
            aggregate.precision += entry.precision;
            aggregate.recall += entry.recall;
            aggregate.f1 += entry.f1;

            const auto weight = static_cast<double>(entry.support);
            aggregate.weighted_precision += weight * entry.precision;
            aggregate.weighted_recall += weight * entry.recall;
            aggregate.weighted_f1 += weight * entry.f1;
            total_support += weight;
        }

        const auto classes = static_cast<double>(per_class.size());
        aggregate.precision /= classes;
        aggregate.recall /= classes;
        aggregate.f1 /= classes;
        if (total_support > 0.0) {
            aggregate.weighted_precision /= total_support;
            aggregate.weighted_recall /= total_support;
            aggregate.weighted_f1 /= total_support;
        }
        return aggregate;
    }

} // namespace evaluation
