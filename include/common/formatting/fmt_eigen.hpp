// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>

/*
 * Formatter for Eigen column vectors and matrices, printed as a flat bracketed list in storage order.
 * Supports an optional precision: fmt::format("{:.3}", vector) -> "[0.125, 0.031, ...]".
 * Default: full precision ('g').
 */
template<typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> {
    int precision = -1;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == '.') {
            ++it;
            int parsed_precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                parsed_precision = parsed_precision * 10 + (*it - '0');
                ++it;
            }
            precision = parsed_precision;
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> &matrix,
                FormatContext &ctx) const {
        auto out = ctx.out();
        *out++ = '[';
        for (Eigen::Index i = 0; i < matrix.size(); ++i) {
            if (i != 0) {
                *out++ = ',';
                *out++ = ' ';
            }
            out = precision >= 0 ? fmt::format_to(out, "{:.{}g}", matrix.data()[i], precision)
                                 : fmt::format_to(out, "{}", matrix.data()[i]);
        }
        *out++ = ']';
        return out;
    }
};

#endif // FMT_EIGEN_HPP
