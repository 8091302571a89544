#include "command_dispatcher.h"

#include <QLoggingCategory>

#include "color_resolver.h"
#include "light_control.h"

namespace lumactl {

Q_LOGGING_CATEGORY(dispatchLog, "lumactl.dispatch")

namespace {

DispatchOutcome failed(CmdStatus status, const QString &error, const QString &label = {})
{
    DispatchOutcome outcome;
    outcome.result = DispatchOutcome::Result::Failed;
    outcome.status = status;
    outcome.reason = error;
    outcome.label = label;
    return outcome;
}

} // namespace

DesiredState DesiredState::fromPowerToken(const QString &token, int transitionMs)
{
    DesiredState state;
    state.token = token;
    state.transitionMs = transitionMs;
    if (token == QLatin1String("on"))
        state.kind = Kind::PowerOn;
    else if (token == QLatin1String("off"))
        state.kind = Kind::PowerOff;
    else if (token == QLatin1String("toggle"))
        state.kind = Kind::Toggle;
    else
        state.kind = Kind::Unsupported;
    return state;
}

DesiredState DesiredState::setColor(const QColor &color, quint16 kelvin, int transitionMs)
{
    DesiredState state;
    state.kind = Kind::SetColor;
    state.color = color;
    state.kelvin = kelvin;
    state.transitionMs = transitionMs;
    state.token = QStringLiteral("color");
    return state;
}

CommandDispatcher::CommandDispatcher(LightControl &control, const CancellationToken &cancel)
    : m_control(control)
    , m_cancel(cancel)
{
}

DispatchOutcome CommandDispatcher::dispatch(const Device &device, const DesiredState &desired)
{
    if (desired.kind == DesiredState::Kind::Unsupported) {
        qCWarning(dispatchLog).noquote() << "Unsupported state:" << desired.token;
        DispatchOutcome outcome;
        outcome.result = DispatchOutcome::Result::Rejected;
        outcome.status = CmdStatus::NotSupported;
        outcome.reason = QStringLiteral("unsupported state");
        return outcome;
    }

    if (m_cancel.isCancelled())
        return failed(CmdStatus::Cancelled, QStringLiteral("Cancelled before querying %1").arg(device.hostName));

    const LightStateResult current = m_control.queryLightState(device, m_cancel);
    if (!current.ok())
        return failed(current.status, current.error);

    DispatchOutcome outcome;
    outcome.label = current.state.label;

    switch (desired.kind) {
    case DesiredState::Kind::PowerOn:
    case DesiredState::Kind::PowerOff: {
        const bool wantOn = desired.kind == DesiredState::Kind::PowerOn;
        qCInfo(dispatchLog).noquote()
            << QStringLiteral("Request: 'Switch %1 %2'").arg(outcome.label, desired.token);
        if (current.state.on == wantOn) {
            qCInfo(dispatchLog).noquote()
                << QStringLiteral("Light is already %1.  Doing nothing.").arg(desired.token);
            outcome.result = DispatchOutcome::Result::Skipped;
            outcome.reason = wantOn ? QStringLiteral("already on") : QStringLiteral("already off");
            return outcome;
        }
        return applyPower(device, wantOn, desired.transitionMs, outcome);
    }
    case DesiredState::Kind::Toggle:
        qCInfo(dispatchLog).noquote()
            << QStringLiteral("Request: 'Switch %1 %2'").arg(outcome.label, desired.token);
        return applyPower(device, !current.state.on, desired.transitionMs, outcome);
    case DesiredState::Kind::SetColor: {
        qCInfo(dispatchLog).noquote()
            << QStringLiteral("Request: 'Color %1 %2 %3'")
                   .arg(outcome.label, colorToHex(desired.color))
                   .arg(desired.kelvin);
        const CmdResult sent = m_control.setColor(device, desired.color, desired.kelvin,
                                                  desired.transitionMs, m_cancel);
        if (!sent.ok())
            return failed(sent.status, sent.error, outcome.label);
        qCDebug(dispatchLog) << "Done";
        outcome.result = DispatchOutcome::Result::Applied;
        return outcome;
    }
    case DesiredState::Kind::Unsupported:
        break;
    }

    return failed(CmdStatus::NotSupported, QStringLiteral("unsupported state"), outcome.label);
}

DispatchOutcome CommandDispatcher::applyPower(const Device &device, bool on, int transitionMs,
                                              DispatchOutcome outcome)
{
    const CmdResult sent = m_control.setPower(device, on, transitionMs, m_cancel);
    if (!sent.ok())
        return failed(sent.status, sent.error, outcome.label);

    qCDebug(dispatchLog) << "Done";
    outcome.result = DispatchOutcome::Result::Applied;
    return outcome;
}

} // namespace lumactl
