// File: processing/image/feature/extractor.cpp

#include "processing/image/feature/extractor.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "common/logging/logger.hpp"
#include "processing/image/feature/extractor/color_histogram_extractor.hpp"
#include "processing/image/feature/extractor/lesion_shape_extractor.hpp"
#include "processing/image/feature/extractor/local_variance_extractor.hpp"

namespace processing::image {
    std::shared_ptr<FeatureExtractor> FeatureExtractor::create(const std::string_view band) {
        static const auto extractorMap =
                std::unordered_map<std::string_view, std::function<std::shared_ptr<FeatureExtractor>()>>{
                        {"color", [] { return std::make_shared<ColorHistogramExtractor>(); }},
                        {"texture", [] { return std::make_shared<LocalVarianceExtractor>(); }},
                        {"shape", [] { return std::make_shared<LesionShapeExtractor>(); }}};

        std::string band_name(band);
        std::ranges::transform(band_name, band_name.begin(), [](const unsigned char c) { return std::tolower(c); });

        if (const auto it = extractorMap.find(band_name); it != extractorMap.end()) {
            LOG_DEBUG("Creating {} feature extractor.", band_name);
            return it->second();
        }

        LOG_ERROR("Unknown feature band '{}'.", band_name);
        throw std::invalid_argument(fmt::format("Unknown feature band '{}'", band_name));
    }
} // namespace processing::image
