#include <iostream>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QProcessEnvironment>

#include "app_config.h"
#include "cancellation.h"
#include "cli.h"
#include "device_registry.h"
#include "hue_light_control.h"

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("lumactl"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    const lumactl::CommandLine commandLine = lumactl::parseCommandLine(parser, QCoreApplication::arguments());
    switch (commandLine.action) {
    case lumactl::CommandLine::Action::ShowHelp:
        parser.showHelp(lumactl::ExitSuccess);
    case lumactl::CommandLine::Action::ShowVersion:
        parser.showVersion();
    case lumactl::CommandLine::Action::Error:
        std::cerr << "Usage incorrect: " << commandLine.error.toStdString() << '\n';
        return lumactl::ExitUsage;
    case lumactl::CommandLine::Action::Run:
        break;
    }

    qSetMessagePattern(QStringLiteral("%{if-debug}[debug] %{endif}%{if-warning}[warn] %{endif}"
                                      "%{if-critical}[error] %{endif}%{message}"));

    lumactl::AppConfig config;
    QString error;
    if (!lumactl::loadAppConfig(commandLine.configPath,
                                QProcessEnvironment::systemEnvironment(),
                                &config,
                                &error)) {
        std::cerr << error.toStdString() << '\n';
        return lumactl::ExitFailure;
    }

    if (commandLine.timeoutMs > 0)
        config.resolveTimeoutMs = commandLine.timeoutMs;

    if (commandLine.verbose || config.verbose)
        QLoggingCategory::setFilterRules(QStringLiteral("lumactl.*.debug=true"));
    else
        QLoggingCategory::setFilterRules(QStringLiteral("lumactl.*.debug=false"));

    lumactl::installInterruptHandlers();
    lumactl::CancellationToken &cancel = lumactl::processCancellation();

    lumactl::DeviceRegistry registry;
    lumactl::hue::HueLightControl control(config.bridge, config.pollIntervalMs, cancel);
    lumactl::Cli cli(control, registry, cancel, config);

    return cli.run(commandLine.positional);
}
