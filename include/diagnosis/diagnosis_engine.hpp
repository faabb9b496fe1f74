// File: diagnosis/diagnosis_engine.hpp

#ifndef DIAGNOSIS_ENGINE_HPP
#define DIAGNOSIS_ENGINE_HPP

#include "config/configuration.hpp"
#include "types/diagnosis_result.hpp"
#include "types/neighbor_match.hpp"

namespace diagnosis {

    /*
     * Inverse-distance-weighted majority vote over neighbor categories.
     *
     * weight(neighbor) = 1 / (distance + distance_epsilon). The category with the largest total
     * weight wins; totals within tie_tolerance (relative) are tied and go to the category of the
     * nearest neighbor, or to the smallest label when the nearest neighbor is not among them.
     * Confidence is the winner's share of the total weight in percent. When every category is
     * tied the confidence is the lowest competing share.
     */
    class DiagnosisEngine {
    public:
        struct Config {
            double distance_epsilon;
            double tie_tolerance;
            double reliable_confidence;
            double probable_confidence;

            Config() :
                distance_epsilon(config::get("diagnosis.distance_epsilon", 1e-6)),
                tie_tolerance(config::get("diagnosis.tie_tolerance", 1e-9)),
                reliable_confidence(config::get("diagnosis.status.reliable", 80.0)),
                probable_confidence(config::get("diagnosis.status.probable", 50.0)) {}
        };

        explicit DiagnosisEngine(const Config &config = Config());

        virtual ~DiagnosisEngine() = default;

        // Throws std::invalid_argument for an empty list or a negative/non-finite distance.
        [[nodiscard]] virtual types::DiagnosisResult diagnose(const types::NeighborMatches &neighbors) const;

        [[nodiscard]] types::DiagnosisStatus classify(double confidence) const noexcept;

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        Config config_;
    };

} // namespace diagnosis

#endif // DIAGNOSIS_ENGINE_HPP
