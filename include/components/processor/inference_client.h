#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "frame_types.h"
#include "result.h"

namespace facegate {

/**
 * @brief Abstract interface for the remote face inference service
 */
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    /**
     * @brief Detect faces in a JPEG image
     *
     * @param jpeg Encoded image
     * @return Result<std::vector<DetectionBox>> Boxes in the image's pixel coordinates
     */
    virtual Result<std::vector<DetectionBox>> detect(const std::vector<unsigned char>& jpeg) = 0;

    /**
     * @brief Identify the face in a cropped JPEG image
     *
     * Returns the service's top-ranked prediction as reported, without
     * applying the confidence threshold. A response with no predictions
     * yields the unknown identity with zero confidence.
     *
     * @param jpeg Encoded face crop
     * @return Result<RecognitionResult> Reported identity and confidence
     */
    virtual Result<RecognitionResult> recognize(const std::vector<unsigned char>& jpeg) = 0;

    /**
     * @brief Enrol a face image under a user id
     *
     * @param jpeg Encoded image containing one face
     * @param userId Identity to register
     * @return Result<void> Success or the failure reason
     */
    virtual Result<void> registerFace(const std::vector<unsigned char>& jpeg, const std::string& userId) = 0;
};

/**
 * @brief InferenceClient speaking the CodeProject.AI face API over HTTP
 */
class CodeProjectFaceClient : public InferenceClient {
public:
    struct Options {
        std::string serverUrl = "http://localhost:32168/v1";
        long connectTimeoutMs = 1000;
        long detectTimeoutMs = 3000;
        long recognizeTimeoutMs = 4000;
        long registerTimeoutMs = 2500;
        double minConfidence = 0.60;   ///< Forwarded to the recognize endpoint
    };

    explicit CodeProjectFaceClient(Options options);

    Result<std::vector<DetectionBox>> detect(const std::vector<unsigned char>& jpeg) override;
    Result<RecognitionResult> recognize(const std::vector<unsigned char>& jpeg) override;
    Result<void> registerFace(const std::vector<unsigned char>& jpeg, const std::string& userId) override;

    const Options& getOptions() const { return options_; }

    /**
     * @brief Parse a vision/face response body
     */
    static Result<std::vector<DetectionBox>> parseDetectResponse(const std::string& body);

    /**
     * @brief Parse a vision/face/recognize response body
     */
    static Result<RecognitionResult> parseRecognizeResponse(const std::string& body);

    /**
     * @brief Parse a vision/face/register response body
     */
    static Result<void> parseRegisterResponse(const std::string& body);

private:
    Options options_;
};

} // namespace facegate
