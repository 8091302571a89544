#include "cli.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QLoggingCategory>

#include "color_resolver.h"
#include "command_dispatcher.h"
#include "device_registry.h"
#include "device_waiter.h"
#include "discovery_session.h"
#include "light_control.h"

namespace lumactl {

Q_LOGGING_CATEGORY(cliLog, "lumactl.cli")

namespace {

CmdResult missing(const QString &name)
{
    return CmdResult::failure(CmdStatus::MissingParameter, QStringLiteral("Missing parameter: %1").arg(name));
}

CmdResult fromOutcome(const DispatchOutcome &outcome)
{
    switch (outcome.result) {
    case DispatchOutcome::Result::Applied:
    case DispatchOutcome::Result::Skipped:
    case DispatchOutcome::Result::Rejected:
        return CmdResult::success();
    case DispatchOutcome::Result::Failed:
        break;
    }
    return CmdResult::failure(outcome.status, outcome.reason);
}

} // namespace

int exitCodeFor(CmdStatus status)
{
    switch (status) {
    case CmdStatus::Success:
    case CmdStatus::NotSupported:
        return ExitSuccess;
    case CmdStatus::Timeout:
    case CmdStatus::Cancelled:
        return ExitTimeout;
    case CmdStatus::InvalidArgument:
    case CmdStatus::MissingParameter:
        return ExitUsage;
    case CmdStatus::DeviceFailure:
        return ExitFailure;
    }
    return ExitFailure;
}

QString usageText(const QString &mode)
{
    if (mode == QLatin1String("discover"))
        return QStringLiteral("Usage:\nlumactl discover [maxDiscoveryTimeInSeconds, default=5]");
    if (mode == QLatin1String("switch") || mode == QLatin1String("set"))
        return QStringLiteral("Usage:\nlumactl %1 <deviceHostname> <on|off|toggle> [transitionMs, default=0]").arg(mode);
    if (mode == QLatin1String("color"))
        return QStringLiteral("Usage:\nlumactl color <deviceHostname> <colorNameOrHex> <kelvin> [transitionMs, default=0]");
    return {};
}

CommandLine parseCommandLine(QCommandLineParser &parser, const QStringList &arguments)
{
    parser.setApplicationDescription(QStringLiteral("Controls network smart lights"));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Read configuration from <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                           QStringLiteral("Wait at most <ms> for the device to be discovered."),
                                           QStringLiteral("ms"));
    parser.addOption(verboseOption);
    parser.addOption(configOption);
    parser.addOption(timeoutOption);
    parser.addPositionalArgument(QStringLiteral("mode"),
                                 QStringLiteral("discover, switch|set, color or help"));
    parser.addPositionalArgument(QStringLiteral("parameters"),
                                 QStringLiteral("Mode parameters, see 'help <mode>'."),
                                 QStringLiteral("[parameters...]"));

    CommandLine out;
    if (!parser.parse(arguments)) {
        out.action = CommandLine::Action::Error;
        out.error = parser.errorText();
        return out;
    }
    if (parser.isSet(helpOption)) {
        out.action = CommandLine::Action::ShowHelp;
        return out;
    }
    if (parser.isSet(versionOption)) {
        out.action = CommandLine::Action::ShowVersion;
        return out;
    }

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int timeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeoutMs <= 0) {
            out.action = CommandLine::Action::Error;
            out.error = QStringLiteral("Non-integer option: timeout '%1'").arg(parser.value(timeoutOption));
            return out;
        }
        out.timeoutMs = timeoutMs;
    }

    out.verbose = parser.isSet(verboseOption);
    out.configPath = parser.value(configOption);
    out.positional = parser.positionalArguments();
    return out;
}

Cli::Cli(LightControl &control,
         DeviceRegistry &registry,
         const CancellationToken &cancel,
         const AppConfig &config)
    : m_control(control)
    , m_registry(registry)
    , m_cancel(cancel)
    , m_config(config)
{
}

int Cli::run(const QStringList &args)
{
    const QStringList effective = args.isEmpty() ? QStringList{QStringLiteral("help")} : args;
    const QString mode = effective.first();

    CmdResult result;
    if (mode == QLatin1String("discover")) {
        result = runDiscover(effective);
    } else if (mode == QLatin1String("switch") || mode == QLatin1String("set")) {
        result = runSwitch(effective);
    } else if (mode == QLatin1String("color")) {
        result = runColor(effective);
    } else if (mode == QLatin1String("help")) {
        result = runHelp(effective);
    } else {
        qCCritical(cliLog).noquote() << QStringLiteral("Unsupported mode '%1'").arg(mode);
        return ExitSuccess;
    }

    qCDebug(cliLog).noquote() << QStringLiteral("Mode '%1' finished: %2").arg(mode, cmdStatusName(result.status));
    switch (result.status) {
    case CmdStatus::Success:
    case CmdStatus::NotSupported:
        qCDebug(cliLog) << "Exiting";
        break;
    case CmdStatus::Timeout:
    case CmdStatus::Cancelled:
        qCCritical(cliLog).noquote() << "Timeout:" << result.error;
        break;
    case CmdStatus::InvalidArgument:
    case CmdStatus::MissingParameter:
        qCCritical(cliLog).noquote() << "Usage incorrect:" << result.error;
        break;
    case CmdStatus::DeviceFailure:
        qCCritical(cliLog).noquote() << "Device failure:" << result.error;
        break;
    }

    return exitCodeFor(result.status);
}

int Cli::transitionFromArgs(const QStringList &args, int index) const
{
    if (args.size() <= index) {
        qCDebug(cliLog) << "Missing parameter: transitionTimeSpanMs.  Using 0";
        return 0;
    }

    bool ok = false;
    const int transitionMs = args.at(index).toInt(&ok);
    if (!ok || transitionMs < 0) {
        qCDebug(cliLog).noquote() << "Invalid transition" << args.at(index) << "- using 0";
        return 0;
    }

    qCDebug(cliLog).noquote() << QStringLiteral("TransitionTimeSpan %1ms").arg(transitionMs);
    return transitionMs;
}

CmdResult Cli::resolveDevice(const QString &hostName, Device *device)
{
    const DeviceWaiter waiter(m_registry, m_cancel);
    const WaitResult found = waiter.waitFor(hostName, m_config.resolveTimeoutMs);
    if (!found.ok())
        return CmdResult::failure(found.status, found.error);

    *device = found.device;
    return CmdResult::success();
}

CmdResult Cli::runSwitch(const QStringList &args)
{
    if (args.size() < 2)
        return missing(QStringLiteral("deviceHostname"));
    const QString hostName = args.at(1);
    qCDebug(cliLog).noquote() << "Device hostname:" << hostName;

    if (args.size() < 3)
        return missing(QStringLiteral("desiredState"));
    const QString stateToken = args.at(2);
    qCDebug(cliLog).noquote() << "Desired state:" << stateToken;

    const DesiredState desired = DesiredState::fromPowerToken(stateToken, transitionFromArgs(args, 3));

    DiscoverySession session(m_control, m_registry);
    QString error;
    if (!session.start(&error))
        return CmdResult::failure(CmdStatus::DeviceFailure, error);

    Device device;
    const CmdResult resolved = resolveDevice(hostName, &device);
    if (!resolved.ok())
        return resolved;

    CommandDispatcher dispatcher(m_control, m_cancel);
    return fromOutcome(dispatcher.dispatch(device, desired));
}

CmdResult Cli::runColor(const QStringList &args)
{
    if (args.size() < 2)
        return missing(QStringLiteral("deviceHostname"));
    const QString hostName = args.at(1);
    qCDebug(cliLog).noquote() << "Device hostname:" << hostName;

    if (args.size() < 3)
        return missing(QStringLiteral("desiredColor"));
    const QString colorText = args.at(2);
    const ColorResult color = resolveColor(colorText);
    if (!color.ok)
        return CmdResult::failure(CmdStatus::InvalidArgument, color.error);
    if (!color.hasColor)
        return CmdResult::failure(CmdStatus::InvalidArgument,
                                  QStringLiteral("Could not determine color from '%1'").arg(colorText));

    if (args.size() < 4)
        return missing(QStringLiteral("desiredKelvin"));
    const QString kelvinText = args.at(3);
    bool ok = false;
    const ushort kelvin = kelvinText.toUShort(&ok);
    if (!ok)
        return CmdResult::failure(CmdStatus::InvalidArgument,
                                  QStringLiteral("Non-ushort parameter: desiredKelvin '%1'").arg(kelvinText));

    const DesiredState desired = DesiredState::setColor(color.color, kelvin, transitionFromArgs(args, 4));

    DiscoverySession session(m_control, m_registry);
    QString error;
    if (!session.start(&error))
        return CmdResult::failure(CmdStatus::DeviceFailure, error);

    Device device;
    const CmdResult resolved = resolveDevice(hostName, &device);
    if (!resolved.ok())
        return resolved;

    CommandDispatcher dispatcher(m_control, m_cancel);
    return fromOutcome(dispatcher.dispatch(device, desired));
}

CmdResult Cli::runDiscover(const QStringList &args)
{
    int seconds = m_config.discoverSeconds;
    bool ok = false;
    if (args.size() > 1) {
        const int requested = args.at(1).toInt(&ok);
        if (ok && requested > 0)
            seconds = requested;
        else
            ok = false;
    }
    qCDebug(cliLog).noquote() << QStringLiteral("Discovery time: %1s%2").arg(seconds).arg(ok ? QString() : QStringLiteral(" (default)"));

    {
        DiscoverySession session(m_control, m_registry);
        QString error;
        if (!session.start(&error))
            return CmdResult::failure(CmdStatus::DeviceFailure, error);

        if (!waitCancellable(seconds * 1000, m_cancel))
            return CmdResult::failure(CmdStatus::Cancelled, QStringLiteral("Discovery cancelled"));
        qCDebug(cliLog) << "Discovery window elapsed";
    }

    const QList<Device> devices = m_registry.devices();
    for (const Device &device : devices) {
        const LightStateResult state = m_control.queryLightState(device, m_cancel);
        if (state.status == CmdStatus::Cancelled)
            return CmdResult::failure(CmdStatus::Cancelled, state.error);
        if (!state.ok()) {
            qCWarning(cliLog).noquote() << QStringLiteral("Found: %1 (mac=%2, service=%3), state unavailable: %4")
                                               .arg(device.hostName, device.macAddress, device.service, state.error);
            continue;
        }

        const LightState &light = state.state;
        qCInfo(cliLog).noquote()
            << QStringLiteral("Found: %1 (mac=%2, service=%3), Called: %4, BSHK=(%5, %6, %7, %8)")
                   .arg(device.hostName, device.macAddress, device.service, light.label)
                   .arg(light.brightness, 0, 'f', 1)
                   .arg(light.saturation, 0, 'f', 1)
                   .arg(light.hue, 0, 'f', 1)
                   .arg(light.kelvin);
    }

    return CmdResult::success();
}

CmdResult Cli::runHelp(const QStringList &args)
{
    if (args.size() <= 1)
        return CmdResult::failure(CmdStatus::MissingParameter, QStringLiteral("Missing mode"));

    const QString mode = args.at(1);
    const QString usage = usageText(mode);
    if (usage.isEmpty()) {
        qCCritical(cliLog).noquote() << QStringLiteral("Unsupported help mode '%1'").arg(mode);
        return CmdResult::failure(CmdStatus::NotSupported, QStringLiteral("Unsupported help mode '%1'").arg(mode));
    }

    qCInfo(cliLog).noquote() << usage;
    return CmdResult::success();
}

} // namespace lumactl
