#pragma once

#include <QStringList>

class QCommandLineParser;

#include "app_config.h"
#include "cancellation.h"
#include "light_types.h"

namespace lumactl {

class DeviceRegistry;
class LightControl;

enum ExitCode {
    ExitSuccess = 0,
    ExitTimeout = 1,
    ExitUsage = 2,
    ExitFailure = 3
};

int exitCodeFor(CmdStatus status);

QString usageText(const QString &mode);

struct CommandLine {
    enum class Action {
        Run,
        ShowHelp,
        ShowVersion,
        Error
    };

    Action action = Action::Run;
    bool verbose = false;
    QString configPath;
    int timeoutMs = 0;   // 0 when --timeout was not given
    QStringList positional;
    QString error;
};

// Options are only recognized before the mode; everything after it is a
// positional parameter, so "switch bulb1 on -5" keeps its "-5".
CommandLine parseCommandLine(QCommandLineParser &parser, const QStringList &arguments);

// Runs one invocation: mode selector followed by its positional parameters.
class Cli
{
public:
    Cli(LightControl &control,
        DeviceRegistry &registry,
        const CancellationToken &cancel,
        const AppConfig &config);

    int run(const QStringList &args);

private:
    CmdResult runDiscover(const QStringList &args);
    CmdResult runSwitch(const QStringList &args);
    CmdResult runColor(const QStringList &args);
    CmdResult runHelp(const QStringList &args);

    CmdResult resolveDevice(const QString &hostName, Device *device);
    int transitionFromArgs(const QStringList &args, int index) const;

    LightControl &m_control;
    DeviceRegistry &m_registry;
    const CancellationToken &m_cancel;
    AppConfig m_config;
};

} // namespace lumactl
