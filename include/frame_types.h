#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "result.h"

namespace facegate {

/// Label used for any face that was not matched with enough confidence
extern const char* const kUnknownIdentity;

/**
 * @brief A captured video frame
 *
 * The pixel buffer is never written after capture, so the handoff, the
 * result set and the overlay may share it without copying.
 */
struct Frame {
    cv::Mat image;                                      ///< BGR pixels
    uint64_t sequenceId = 0;                            ///< Monotonic capture counter
    std::chrono::steady_clock::time_point capturedAt;   ///< Capture time

    bool empty() const { return image.empty(); }
};

/**
 * @brief Face rectangle in the coordinate space of the submitted image
 */
struct DetectionBox {
    int xMin = 0;
    int yMin = 0;
    int xMax = 0;
    int yMax = 0;

    int width() const { return xMax - xMin; }
    int height() const { return yMax - yMin; }
    cv::Rect toRect() const { return cv::Rect(xMin, yMin, width(), height()); }
};

/**
 * @brief Identity assigned to one detection box
 */
struct RecognitionResult {
    std::string identity = kUnknownIdentity;
    double confidence = 0.0;

    bool isKnown() const { return identity != kUnknownIdentity; }
};

/**
 * @brief A detection box paired with its recognition outcome
 */
struct FaceResult {
    DetectionBox box;
    RecognitionResult recognition;
};

/**
 * @brief Outcome of one inference cycle
 *
 * Published as a whole into the ResultCache and never modified afterwards.
 */
struct ResultSet {
    std::vector<FaceResult> faces;          ///< Ordered as returned by the detector
    uint64_t sequenceId = 0;                ///< Sequence id of the producing frame
    std::optional<Error> error;             ///< Set when the detect stage failed
    cv::Mat frame;                          ///< Image that was submitted for detection
    std::chrono::steady_clock::time_point completedAt;

    bool hasError() const { return error.has_value(); }
    bool anyKnown() const;
    bool anyUnknown() const;
};

} // namespace facegate
