#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "result.h"

namespace facegate {
namespace utils {

/**
 * @brief Encode an image as JPEG
 *
 * @param image Image to encode
 * @param quality JPEG quality in [1, 100]
 * @return Result<std::vector<unsigned char>> Encoded bytes or EncodeFailure
 */
Result<std::vector<unsigned char>> encodeJpeg(const cv::Mat& image, int quality = 90);

/**
 * @brief Crop the centred square of an image and resize it
 *
 * @param image Source image
 * @param size Side length of the output square
 * @return cv::Mat Square image, empty if the input is empty
 */
cv::Mat centerSquare(const cv::Mat& image, int size);

} // namespace utils
} // namespace facegate
