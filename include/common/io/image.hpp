// File: common/io/image.hpp

#ifndef COMMON_IMAGE_IO_HPP
#define COMMON_IMAGE_IO_HPP

#include <string>
#include <string_view>

#include <opencv2/imgcodecs.hpp>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace common::io::image {

    /**
     * @brief Reads an image from a file using OpenCV.
     *
     * @param file_path Path to the image file.
     * @param mode Flag specifying the color type of the loaded image.
     * @return cv::Mat The decoded image.
     * @throws common::InvalidImageError if the image could not be read or decoded.
     */
    inline cv::Mat readImage(std::string_view file_path, const cv::ImreadModes mode = cv::IMREAD_COLOR) {
        LOG_TRACE("Reading image from file: {}", file_path);
        cv::Mat image = cv::imread(std::string(file_path), mode);
        if (image.empty()) {
            LOG_ERROR("Could not read image: {}", file_path);
            throw InvalidImageError(fmt::format("Could not read image: {}", file_path));
        }
        return image;
    }

} // namespace common::io::image

#endif // COMMON_IMAGE_IO_HPP
