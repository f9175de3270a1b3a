#include "util/result.hpp"

namespace forge {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "None";
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::PreconditionFailed:  return "PreconditionFailed";
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::BuildTimeout:        return "BuildTimeout";
        case ErrorCode::BuildProcessFailure: return "BuildProcessFailure";
        case ErrorCode::ArtifactMissing:     return "ArtifactMissing";
        case ErrorCode::BuildCancelled:      return "BuildCancelled";
        case ErrorCode::SigningUnavailable:  return "SigningUnavailable";
        case ErrorCode::Io:                  return "Io";
        case ErrorCode::Internal:            return "Internal";
    }
    return "Unknown";
}

} // namespace forge
