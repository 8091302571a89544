#pragma once

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include "hue_http.h"

namespace lumactl {

struct AppConfig {
    hue::ConnectionSettings bridge;
    int pollIntervalMs = 2000;
    int resolveTimeoutMs = 10000;
    int discoverSeconds = 5;
    bool verbose = false;
};

// Explicit path, then LUMACTL_CONFIG, then the per-user config location.
// Empty when none applies or the default file does not exist.
QString configFilePath(const QString &explicitPath, const QProcessEnvironment &env);

void applyConfigObject(const QJsonObject &root, AppConfig *config);
void applyEnvironment(const QProcessEnvironment &env, AppConfig *config);

bool loadAppConfig(const QString &explicitPath,
                   const QProcessEnvironment &env,
                   AppConfig *config,
                   QString *error = nullptr);

} // namespace lumactl
