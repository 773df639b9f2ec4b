#pragma once

#include <atomic>

namespace verdict::utils {

class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool IsCancelled(const CancellationToken* token) {
    return token != nullptr && token->IsCancelled();
}

}  // namespace verdict::utils
