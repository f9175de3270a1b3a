#pragma once

#include <string>

namespace forge {

class VersionString {
public:
    // MAJOR.MINOR.PATCH (two or three numeric parts), optional "-pre" / "+build".
    static bool IsValid(const std::string& version);
};

} // namespace forge
