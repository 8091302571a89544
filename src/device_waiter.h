#pragma once

#include <functional>

#include <QString>

#include "cancellation.h"
#include "light_types.h"

namespace lumactl {

class DeviceRegistry;

enum class PollOutcome {
    Satisfied,
    TimedOut,
    Cancelled
};

// Evaluates condition now and then every intervalMs until it holds, timeoutMs
// elapsed or cancel fires. Between attempts the Qt event loop keeps running.
PollOutcome pollUntil(const std::function<bool()> &condition,
                      int intervalMs,
                      int timeoutMs,
                      const CancellationToken &cancel);

// Sleeps for durationMs while processing events; false if cancelled first.
bool waitCancellable(int durationMs, const CancellationToken &cancel);

struct WaitResult {
    CmdStatus status = CmdStatus::Success;
    QString error;
    Device device;

    bool ok() const { return status == CmdStatus::Success; }
};

class DeviceWaiter
{
public:
    static constexpr int kPollIntervalMs = 100;

    DeviceWaiter(const DeviceRegistry &registry, const CancellationToken &cancel);

    WaitResult waitFor(const QString &hostName, int timeoutMs) const;

private:
    const DeviceRegistry &m_registry;
    const CancellationToken &m_cancel;
};

} // namespace lumactl
