#include "discovery_session.h"

#include <QLoggingCategory>

#include "device_registry.h"
#include "light_control.h"

namespace lumactl {

Q_LOGGING_CATEGORY(sessionLog, "lumactl.discovery")

DiscoverySession::DiscoverySession(LightControl &control, DeviceRegistry &registry)
    : m_control(control)
    , m_registry(registry)
{
}

DiscoverySession::~DiscoverySession()
{
    stop();
}

bool DiscoverySession::start(QString *error)
{
    if (m_active) {
        if (error)
            error->clear();
        return true;
    }

    QObject::connect(&m_control, &LightControl::deviceDiscovered,
                     &m_registry, &DeviceRegistry::onDiscovered);
    QObject::connect(&m_control, &LightControl::deviceLost,
                     &m_registry, &DeviceRegistry::onLostDevice);

    QString startError;
    if (!m_control.startDiscovery(&startError)) {
        QObject::disconnect(&m_control, nullptr, &m_registry, nullptr);
        qCWarning(sessionLog).noquote() << "Failed to start discovery:" << startError;
        if (error)
            *error = startError.isEmpty() ? QStringLiteral("Discovery could not be started") : startError;
        return false;
    }

    m_active = true;
    qCDebug(sessionLog) << "Discovery started";
    if (error)
        error->clear();
    return true;
}

void DiscoverySession::stop()
{
    if (!m_active)
        return;

    m_active = false;
    m_control.stopDiscovery();
    QObject::disconnect(&m_control, nullptr, &m_registry, nullptr);
    qCDebug(sessionLog) << "Discovery stopped";
}

} // namespace lumactl
