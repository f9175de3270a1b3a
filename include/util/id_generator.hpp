#pragma once

#include <string>

namespace forge {

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
std::string GenerateId();

} // namespace forge
