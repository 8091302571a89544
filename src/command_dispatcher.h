#pragma once

#include <QColor>
#include <QString>

#include "cancellation.h"
#include "light_types.h"

namespace lumactl {

class LightControl;

struct DesiredState {
    enum class Kind {
        PowerOn,
        PowerOff,
        Toggle,
        SetColor,
        Unsupported
    };

    Kind kind = Kind::Unsupported;
    int transitionMs = 0;
    QColor color;
    quint16 kelvin = 0;
    QString token;

    static DesiredState fromPowerToken(const QString &token, int transitionMs = 0);
    static DesiredState setColor(const QColor &color, quint16 kelvin, int transitionMs = 0);
};

struct DispatchOutcome {
    enum class Result {
        Applied,
        Skipped,
        Rejected,
        Failed
    };

    Result result = Result::Applied;
    CmdStatus status = CmdStatus::Success;
    QString reason;
    QString label;

    bool ok() const { return result != Result::Failed; }
};

// Compares the device's current state with the request and sends only the
// command needed to reach it. Power requests that are already satisfied are
// skipped; color requests are always sent.
class CommandDispatcher
{
public:
    CommandDispatcher(LightControl &control, const CancellationToken &cancel);

    DispatchOutcome dispatch(const Device &device, const DesiredState &desired);

private:
    DispatchOutcome applyPower(const Device &device, bool on, int transitionMs, DispatchOutcome outcome);

    LightControl &m_control;
    const CancellationToken &m_cancel;
};

} // namespace lumactl
