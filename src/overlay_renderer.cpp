#include "overlay_renderer.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <opencv2/imgproc.hpp>

namespace facegate {

const cv::Scalar OverlayRenderer::kKnownColor(0, 255, 0);
const cv::Scalar OverlayRenderer::kUnknownColor(0, 0, 255);

OverlayRenderer::OverlayRenderer()
    : options_() {
}

OverlayRenderer::OverlayRenderer(Options options)
    : options_(options) {
}

std::string OverlayRenderer::formatLabel(const RecognitionResult& recognition) {
    if (!recognition.isKnown()) {
        return recognition.identity;
    }

    std::ostringstream label;
    label << recognition.identity << " (" << std::fixed << std::setprecision(2) << recognition.confidence << ")";
    return label.str();
}

void OverlayRenderer::drawResults(cv::Mat& frame, const ResultSet& resultSet) const {
    for (const auto& face : resultSet.faces) {
        const cv::Scalar& color = face.recognition.isKnown() ? kKnownColor : kUnknownColor;
        cv::rectangle(frame, face.box.toRect(), color, options_.thickness);

        cv::Point origin(face.box.xMin, std::max(20, face.box.yMin - 10));
        cv::putText(frame, formatLabel(face.recognition), origin,
                    cv::FONT_HERSHEY_SIMPLEX, options_.labelFontScale, color, options_.thickness, cv::LINE_AA);
    }
}

void OverlayRenderer::drawTimestamp(cv::Mat& frame) const {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
    localtime_r(&now, &localTime);

    std::ostringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");

    cv::putText(frame, ss.str(), cv::Point(10, 30),
                cv::FONT_HERSHEY_SIMPLEX, options_.timestampFontScale, kKnownColor, 1, cv::LINE_AA);
}

void OverlayRenderer::drawErrorBanner(cv::Mat& frame, const Error& error) const {
    drawStatusLine(frame, "Error: " + error.toString(), 0, kUnknownColor);
}

void OverlayRenderer::drawStatusLine(cv::Mat& frame, const std::string& text, int line, const cv::Scalar& color) const {
    cv::putText(frame, text, cv::Point(10, 65 + line * 30),
                cv::FONT_HERSHEY_SIMPLEX, options_.statusFontScale, color, options_.thickness, cv::LINE_AA);
}

} // namespace facegate
