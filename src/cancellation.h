#pragma once

#include <atomic>

namespace lumactl {

class CancellationToken
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() noexcept { m_cancelled.store(true); }
    bool isCancelled() const noexcept { return m_cancelled.load(); }

private:
    std::atomic_bool m_cancelled{false};
};

// Token cancelled by SIGINT/SIGTERM once installInterruptHandlers() ran.
CancellationToken &processCancellation();

void installInterruptHandlers();

} // namespace lumactl
