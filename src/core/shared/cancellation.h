#pragma once

#include <atomic>
#include <stdexcept>

namespace ox {

// Raised when a caller-owned cancel flag is observed set mid-operation.
class OperationCanceled : public std::runtime_error {
public:
    OperationCanceled()
        : std::runtime_error("operation canceled")
    {
    }
};

inline bool isCanceled(const std::atomic<bool>* cancel)
{
    return cancel != nullptr && cancel->load();
}

inline void throwIfCanceled(const std::atomic<bool>* cancel)
{
    if (isCanceled(cancel)) {
        throw OperationCanceled();
    }
}

} // namespace ox
