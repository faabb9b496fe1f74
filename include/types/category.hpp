// File: types/category.hpp

#ifndef TYPES_CATEGORY_HPP
#define TYPES_CATEGORY_HPP

#include <algorithm>
#include <cctype>
#include <compare>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace types {

    /*
     * Diagnosis label. The category set is open: any non-empty label is a valid category, with
     * Healthy and Diseased as the well-known binary pair.
     */
    class Category {
    public:
        Category() = default;

        explicit Category(std::string label) : label_(std::move(label)) {}

        [[nodiscard]] static Category healthy() { return Category("Healthy"); }
        [[nodiscard]] static Category diseased() { return Category("Diseased"); }

        [[nodiscard]] const std::string &label() const noexcept { return label_; }
        [[nodiscard]] bool empty() const noexcept { return label_.empty(); }

        // Dataset folders name healthy leaves in many ways ("leaf_healthy", "Tomato___healthy").
        [[nodiscard]] bool isHealthy() const {
            std::string lowered(label_);
            std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });
            return lowered.find("healthy") != std::string::npos;
        }

        // Collapse onto the Healthy/Diseased pair.
        [[nodiscard]] Category toBinary() const { return isHealthy() ? healthy() : diseased(); }

        auto operator<=>(const Category &) const = default;
        bool operator==(const Category &) const = default;

    private:
        std::string label_;
    };

} // namespace types

template<>
struct std::hash<types::Category> {
    std::size_t operator()(const types::Category &category) const noexcept {
        return std::hash<std::string>{}(category.label());
    }
};

template<>
struct fmt::formatter<types::Category> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::Category &category, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(category.label(), ctx);
    }
};

#endif // TYPES_CATEGORY_HPP
