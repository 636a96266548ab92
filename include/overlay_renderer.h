#pragma once

#include <string>
#include <opencv2/core.hpp>
#include "frame_types.h"

namespace facegate {

/**
 * @brief Draws recognition results and status text onto display frames
 */
class OverlayRenderer {
public:
    struct Options {
        double labelFontScale = 0.9;
        double timestampFontScale = 1.0;
        double statusFontScale = 0.6;
        int thickness = 2;
    };

    OverlayRenderer();
    explicit OverlayRenderer(Options options);

    /**
     * @brief Draw every box with its label, green for known and red for unknown faces
     */
    void drawResults(cv::Mat& frame, const ResultSet& resultSet) const;

    /**
     * @brief Draw the current local time in the top-left corner
     */
    void drawTimestamp(cv::Mat& frame) const;

    /**
     * @brief Draw the failure of the latest inference cycle below the timestamp
     */
    void drawErrorBanner(cv::Mat& frame, const Error& error) const;

    /**
     * @brief Draw one line of status text
     *
     * @param frame Target image
     * @param text Text to draw
     * @param line Zero-based line below the timestamp
     * @param color BGR colour
     */
    void drawStatusLine(cv::Mat& frame, const std::string& text, int line, const cv::Scalar& color) const;

    /**
     * @brief Label shown above a box, "Name (0.92)" or "Unknown"
     */
    static std::string formatLabel(const RecognitionResult& recognition);

    static const cv::Scalar kKnownColor;
    static const cv::Scalar kUnknownColor;

private:
    Options options_;
};

} // namespace facegate
