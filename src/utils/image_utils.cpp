#include "utils/image_utils.h"
#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace facegate {
namespace utils {

Result<std::vector<unsigned char>> encodeJpeg(const cv::Mat& image, int quality) {
    if (image.empty()) {
        return Result<std::vector<unsigned char>>::error(ErrorKind::EncodeFailure, "Cannot encode an empty image");
    }

    std::vector<unsigned char> buffer;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    try {
        if (!cv::imencode(".jpg", image, buffer, params)) {
            return Result<std::vector<unsigned char>>::error(ErrorKind::EncodeFailure, "cv::imencode returned false");
        }
    } catch (const cv::Exception& e) {
        return Result<std::vector<unsigned char>>::error(ErrorKind::EncodeFailure,
                                                          std::string("cv::imencode failed: ") + e.what());
    }
    return Result<std::vector<unsigned char>>::success(std::move(buffer));
}

cv::Mat centerSquare(const cv::Mat& image, int size) {
    if (image.empty() || size <= 0) {
        return cv::Mat();
    }

    int side = std::min(image.cols, image.rows);
    int x = (image.cols - side) / 2;
    int y = (image.rows - side) / 2;
    cv::Mat square = image(cv::Rect(x, y, side, side));

    cv::Mat resized;
    cv::resize(square, resized, cv::Size(size, size), 0, 0, side > size ? cv::INTER_AREA : cv::INTER_LINEAR);
    return resized;
}

} // namespace utils
} // namespace facegate
