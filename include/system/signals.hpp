#pragma once

#include "util/result.hpp"

#include <atomic>

namespace forge {

// Set by the first SIGINT/SIGTERM once InstallSignalHandlers() has run. The
// handler is one-shot: a second signal terminates the process outright, for
// when a cancelled toolchain does not wind down.
extern std::atomic_bool g_cancel;

Result InstallSignalHandlers();

} // namespace forge
