#include "device_waiter.h"

#include <algorithm>
#include <optional>

#include <QElapsedTimer>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QTimer>

#include "device_registry.h"

namespace lumactl {

Q_LOGGING_CATEGORY(waiterLog, "lumactl.registry.wait")

namespace {

constexpr int kCancelCheckMs = 20;

} // namespace

bool waitCancellable(int durationMs, const CancellationToken &cancel)
{
    if (cancel.isCancelled())
        return false;
    if (durationMs <= 0)
        return true;

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QTimer cancelCheck;

    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(&cancelCheck, &QTimer::timeout, &loop, [&]() {
        if (cancel.isCancelled())
            loop.quit();
    });

    deadline.start(durationMs);
    cancelCheck.start(std::min(kCancelCheckMs, durationMs));
    loop.exec();

    return !cancel.isCancelled();
}

PollOutcome pollUntil(const std::function<bool()> &condition,
                      int intervalMs,
                      int timeoutMs,
                      const CancellationToken &cancel)
{
    QElapsedTimer elapsed;
    elapsed.start();

    for (;;) {
        if (cancel.isCancelled())
            return PollOutcome::Cancelled;
        if (condition())
            return PollOutcome::Satisfied;

        const qint64 remaining = static_cast<qint64>(timeoutMs) - elapsed.elapsed();
        if (remaining <= 0)
            return PollOutcome::TimedOut;

        const int sleepMs = static_cast<int>(std::min<qint64>(intervalMs, remaining));
        if (!waitCancellable(sleepMs, cancel))
            return PollOutcome::Cancelled;
    }
}

DeviceWaiter::DeviceWaiter(const DeviceRegistry &registry, const CancellationToken &cancel)
    : m_registry(registry)
    , m_cancel(cancel)
{
}

WaitResult DeviceWaiter::waitFor(const QString &hostName, int timeoutMs) const
{
    WaitResult result;
    std::optional<Device> found;

    const PollOutcome outcome = pollUntil(
        [&]() {
            found = m_registry.lookup(hostName);
            if (!found)
                qCDebug(waiterLog) << "Waiting to find device" << hostName;
            return found.has_value();
        },
        kPollIntervalMs,
        timeoutMs,
        m_cancel);

    switch (outcome) {
    case PollOutcome::Satisfied:
        result.device = *found;
        break;
    case PollOutcome::TimedOut:
        result.status = CmdStatus::Timeout;
        result.error = QStringLiteral("Timed out waiting to find device '%1'").arg(hostName);
        break;
    case PollOutcome::Cancelled:
        result.status = CmdStatus::Cancelled;
        result.error = QStringLiteral("Cancelled while waiting for device '%1'").arg(hostName);
        break;
    }

    return result;
}

} // namespace lumactl
