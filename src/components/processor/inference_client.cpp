#include "components/processor/inference_client.h"
#include "utils/http_utils.h"
#include "logger.h"
#include <cmath>
#include <limits>

namespace facegate {

namespace {

const char* kDetectRoute = "vision/face";
const char* kRecognizeRoute = "vision/face/recognize";
const char* kRegisterRoute = "vision/face/register";

template<typename T>
Result<T> responseError(const std::string& message) {
    return Result<T>::error(ErrorKind::MalformedResponse, message);
}

Result<nlohmann::json> parseJsonObject(const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return responseError<nlohmann::json>("Invalid JSON response: " + std::string(e.what()));
    }
    if (!response.is_object()) {
        return responseError<nlohmann::json>("Response is not a JSON object");
    }
    return Result<nlohmann::json>::success(std::move(response));
}

// Keeps box arithmetic (width, height, padding) clear of int overflow
constexpr double kMaxCoordinate = std::numeric_limits<int>::max() / 2;

bool readCoordinate(const nlohmann::json& prediction, const char* key, int& value) {
    double raw = prediction[key].get<double>();
    if (!std::isfinite(raw) || std::fabs(raw) > kMaxCoordinate) {
        return false;
    }
    value = static_cast<int>(raw);
    return true;
}

// A body without predictions that names an error is a rejected request
std::string serviceError(const nlohmann::json& response) {
    if (response.contains("error") && response["error"].is_string()) {
        return response["error"].get<std::string>();
    }
    if (response.contains("success") && response["success"].is_boolean() && !response["success"].get<bool>()) {
        return "service reported failure";
    }
    return std::string();
}

Result<utils::HttpResponse> checkedPost(const std::string& url,
                                        const std::vector<utils::MultipartPart>& parts,
                                        long timeoutMs,
                                        long connectTimeoutMs) {
    auto result = utils::postMultipart(url, parts, timeoutMs, connectTimeoutMs);
    if (result.isError()) {
        return result;
    }
    if (!result.getValue().isOk()) {
        return Result<utils::HttpResponse>::error(ErrorKind::MalformedResponse,
            "Server error: " + std::to_string(result.getValue().statusCode));
    }
    return result;
}

} // namespace

CodeProjectFaceClient::CodeProjectFaceClient(Options options)
    : options_(std::move(options)) {
    LOG_INFO("CodeProjectFaceClient", "Using face inference server: " + options_.serverUrl);
}

Result<std::vector<DetectionBox>> CodeProjectFaceClient::detect(const std::vector<unsigned char>& jpeg) {
    std::vector<utils::MultipartPart> parts = {
        utils::MultipartPart::jpeg("image", jpeg)
    };

    auto response = checkedPost(utils::joinUrl(options_.serverUrl, kDetectRoute), parts,
                                options_.detectTimeoutMs, options_.connectTimeoutMs);
    if (response.isError()) {
        return Result<std::vector<DetectionBox>>::error(response.getErrorDetail());
    }
    return parseDetectResponse(response.getValue().body);
}

Result<RecognitionResult> CodeProjectFaceClient::recognize(const std::vector<unsigned char>& jpeg) {
    std::vector<utils::MultipartPart> parts = {
        utils::MultipartPart::jpeg("image", jpeg),
        utils::MultipartPart::text("min_confidence", std::to_string(options_.minConfidence))
    };

    auto response = checkedPost(utils::joinUrl(options_.serverUrl, kRecognizeRoute), parts,
                                options_.recognizeTimeoutMs, options_.connectTimeoutMs);
    if (response.isError()) {
        return Result<RecognitionResult>::error(response.getErrorDetail());
    }
    return parseRecognizeResponse(response.getValue().body);
}

Result<void> CodeProjectFaceClient::registerFace(const std::vector<unsigned char>& jpeg, const std::string& userId) {
    std::vector<utils::MultipartPart> parts = {
        utils::MultipartPart::jpeg("image", jpeg, userId + ".jpg"),
        utils::MultipartPart::text("userid", userId)
    };

    auto response = checkedPost(utils::joinUrl(options_.serverUrl, kRegisterRoute), parts,
                                options_.registerTimeoutMs, options_.connectTimeoutMs);
    if (response.isError()) {
        return Result<void>::error(response.getErrorDetail());
    }
    return parseRegisterResponse(response.getValue().body);
}

Result<std::vector<DetectionBox>> CodeProjectFaceClient::parseDetectResponse(const std::string& body) {
    auto parsed = parseJsonObject(body);
    if (parsed.isError()) {
        return Result<std::vector<DetectionBox>>::error(parsed.getErrorDetail());
    }
    const auto& response = parsed.getValue();

    std::vector<DetectionBox> boxes;
    if (!response.contains("predictions") || !response["predictions"].is_array()) {
        std::string error = serviceError(response);
        if (!error.empty()) {
            return responseError<std::vector<DetectionBox>>("Detection rejected: " + error);
        }
        return Result<std::vector<DetectionBox>>::success(std::move(boxes));
    }

    for (const auto& prediction : response["predictions"]) {
        if (!prediction.is_object() ||
            !prediction.contains("x_min") || !prediction["x_min"].is_number() ||
            !prediction.contains("y_min") || !prediction["y_min"].is_number() ||
            !prediction.contains("x_max") || !prediction["x_max"].is_number() ||
            !prediction.contains("y_max") || !prediction["y_max"].is_number()) {
            LOG_WARN("CodeProjectFaceClient", "Skipping detection without box coordinates: " + prediction.dump());
            continue;
        }

        DetectionBox box;
        if (!readCoordinate(prediction, "x_min", box.xMin) || !readCoordinate(prediction, "y_min", box.yMin) ||
            !readCoordinate(prediction, "x_max", box.xMax) || !readCoordinate(prediction, "y_max", box.yMax)) {
            LOG_WARN("CodeProjectFaceClient", "Skipping detection with out-of-range coordinates: " + prediction.dump());
            continue;
        }

        if (box.width() <= 0 || box.height() <= 0) {
            LOG_WARN("CodeProjectFaceClient", "Skipping degenerate detection box: " + prediction.dump());
            continue;
        }
        boxes.push_back(box);
    }

    return Result<std::vector<DetectionBox>>::success(std::move(boxes));
}

Result<RecognitionResult> CodeProjectFaceClient::parseRecognizeResponse(const std::string& body) {
    auto parsed = parseJsonObject(body);
    if (parsed.isError()) {
        return Result<RecognitionResult>::error(parsed.getErrorDetail());
    }
    const auto& response = parsed.getValue();

    RecognitionResult result;
    if (!response.contains("predictions") || !response["predictions"].is_array()) {
        std::string error = serviceError(response);
        if (!error.empty()) {
            return responseError<RecognitionResult>("Recognition rejected: " + error);
        }
        return Result<RecognitionResult>::success(result);
    }

    const auto& predictions = response["predictions"];
    if (predictions.empty()) {
        return Result<RecognitionResult>::success(result);
    }

    // Predictions are ranked, the first one is the best match
    const auto& top = predictions.front();
    if (!top.is_object()) {
        return responseError<RecognitionResult>("Prediction is not a JSON object");
    }

    if (top.contains("userid") && top["userid"].is_string()) {
        result.identity = top["userid"].get<std::string>();
    }

    if (top.contains("confidence") && top["confidence"].is_number()) {
        result.confidence = top["confidence"].get<double>();
    } else if (top.contains("score") && top["score"].is_number()) {
        result.confidence = top["score"].get<double>();
    }

    return Result<RecognitionResult>::success(result);
}

Result<void> CodeProjectFaceClient::parseRegisterResponse(const std::string& body) {
    auto parsed = parseJsonObject(body);
    if (parsed.isError()) {
        return Result<void>::error(parsed.getErrorDetail());
    }
    const auto& response = parsed.getValue();

    if (response.contains("success") && response["success"].is_boolean() && response["success"].get<bool>()) {
        return Result<void>::success();
    }

    std::string error = serviceError(response);
    return Result<void>::error(ErrorKind::MalformedResponse,
                               "Registration rejected: " + (error.empty() ? std::string("no success flag") : error));
}

} // namespace facegate
