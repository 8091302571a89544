#include "app_config.h"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace lumactl {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

bool parseBool(const QString &text, bool fallback)
{
    const QString value = text.trimmed().toLower();
    if (value == QLatin1String("1") || value == QLatin1String("true") || value == QLatin1String("on"))
        return true;
    if (value == QLatin1String("0") || value == QLatin1String("false") || value == QLatin1String("off"))
        return false;
    return fallback;
}

} // namespace

QString configFilePath(const QString &explicitPath, const QProcessEnvironment &env)
{
    if (!explicitPath.isEmpty())
        return explicitPath;

    const QString envPath = env.value(QStringLiteral("LUMACTL_CONFIG")).trimmed();
    if (!envPath.isEmpty())
        return envPath;

    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty())
        return {};
    const QString path = QDir(dir).filePath(QStringLiteral("config.json"));
    return QFileInfo::exists(path) ? path : QString();
}

void applyConfigObject(const QJsonObject &root, AppConfig *config)
{
    const QJsonObject bridge = root.value(QStringLiteral("bridge")).toObject();
    hue::ConnectionSettings &settings = config->bridge;

    if (bridge.contains(QStringLiteral("host")))
        settings.host = bridge.value(QStringLiteral("host")).toString().trimmed();
    if (bridge.contains(QStringLiteral("ip")))
        settings.ip = bridge.value(QStringLiteral("ip")).toString().trimmed();
    if (bridge.contains(QStringLiteral("appKey")))
        settings.appKey = bridge.value(QStringLiteral("appKey")).toString().trimmed();
    settings.port = readInt(bridge, QStringLiteral("port"), settings.port);

    if (bridge.contains(QStringLiteral("useTls")))
        settings.useTls = bridge.value(QStringLiteral("useTls")).toBool(true);
    else if (settings.port > 0)
        settings.useTls = (settings.port != 80);

    settings.requestTimeoutMs = std::clamp(readInt(root, QStringLiteral("requestTimeoutMs"), settings.requestTimeoutMs),
                                           500, 600000);
    config->pollIntervalMs = std::clamp(readInt(root, QStringLiteral("pollIntervalMs"), config->pollIntervalMs),
                                        250, 600000);
    config->resolveTimeoutMs = std::clamp(readInt(root, QStringLiteral("resolveTimeoutMs"), config->resolveTimeoutMs),
                                          100, 600000);
    config->discoverSeconds = std::clamp(readInt(root, QStringLiteral("discoverSeconds"), config->discoverSeconds),
                                         1, 3600);
    if (root.contains(QStringLiteral("verbose")))
        config->verbose = root.value(QStringLiteral("verbose")).toBool(config->verbose);
}

void applyEnvironment(const QProcessEnvironment &env, AppConfig *config)
{
    hue::ConnectionSettings &settings = config->bridge;

    if (env.contains(QStringLiteral("LUMACTL_BRIDGE_HOST")))
        settings.host = env.value(QStringLiteral("LUMACTL_BRIDGE_HOST")).trimmed();
    if (env.contains(QStringLiteral("LUMACTL_APP_KEY")))
        settings.appKey = env.value(QStringLiteral("LUMACTL_APP_KEY")).trimmed();
    if (env.contains(QStringLiteral("LUMACTL_BRIDGE_PORT"))) {
        bool ok = false;
        const int port = env.value(QStringLiteral("LUMACTL_BRIDGE_PORT")).toInt(&ok);
        if (ok && port > 0 && port < 65536)
            settings.port = port;
    }
    if (env.contains(QStringLiteral("LUMACTL_BRIDGE_TLS")))
        settings.useTls = parseBool(env.value(QStringLiteral("LUMACTL_BRIDGE_TLS")), settings.useTls);
}

bool loadAppConfig(const QString &explicitPath,
                   const QProcessEnvironment &env,
                   AppConfig *config,
                   QString *error)
{
    const QString path = configFilePath(explicitPath, env);
    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            if (error)
                *error = QStringLiteral("Cannot read config %1: %2").arg(path, file.errorString());
            return false;
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            if (error)
                *error = QStringLiteral("Invalid config %1: %2")
                             .arg(path, parseError.error != QJsonParseError::NoError
                                            ? parseError.errorString()
                                            : QStringLiteral("top level is not an object"));
            return false;
        }
        applyConfigObject(doc.object(), config);
    }

    applyEnvironment(env, config);
    if (error)
        error->clear();
    return true;
}

} // namespace lumactl
