#pragma once
#include <string>
#include <utility>

namespace forge {

enum class ErrorCode : int {
    None = 0,
    InvalidArgument,
    PreconditionFailed,
    NotFound,
    BuildTimeout,
    BuildProcessFailure,
    ArtifactMissing,
    BuildCancelled,
    SigningUnavailable,
    Io,
    Internal,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m, int e = 0) {
        return {.ok = false, .code = c, .err = e, .msg = std::move(m)};
    }
};

} // namespace forge
