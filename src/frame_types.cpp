#include "frame_types.h"
#include <algorithm>

namespace facegate {

const char* const kUnknownIdentity = "Unknown";

bool ResultSet::anyKnown() const {
    return std::any_of(faces.begin(), faces.end(), [](const FaceResult& face) {
        return face.recognition.isKnown();
    });
}

bool ResultSet::anyUnknown() const {
    return std::any_of(faces.begin(), faces.end(), [](const FaceResult& face) {
        return !face.recognition.isKnown();
    });
}

} // namespace facegate
