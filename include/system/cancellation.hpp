#pragma once

#include <atomic>
#include <memory>

namespace forge {

// Cooperative stop request shared between a build task and whoever may stop it.
class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic_bool cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace forge
