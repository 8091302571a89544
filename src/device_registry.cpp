#include "device_registry.h"

#include <QLoggingCategory>

namespace lumactl {

Q_LOGGING_CATEGORY(registryLog, "lumactl.registry")

DeviceRegistry::DeviceRegistry(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<lumactl::Device>("lumactl::Device");
}

std::optional<Device> DeviceRegistry::lookup(const QString &hostName) const
{
    QReadLocker locker(&m_lock);
    const auto it = m_devices.constFind(hostName);
    if (it == m_devices.constEnd())
        return std::nullopt;
    return it.value();
}

QList<Device> DeviceRegistry::devices() const
{
    QReadLocker locker(&m_lock);
    return m_devices.values();
}

int DeviceRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_devices.size());
}

void DeviceRegistry::onDiscovered(const Device &device)
{
    qCDebug(registryLog).noquote() << "Found:" << device.hostName
                                   << QStringLiteral("(mac=%1, service=%2)").arg(device.macAddress, device.service);
    {
        QWriteLocker locker(&m_lock);
        m_devices.insert(device.hostName, device);
    }
    emit deviceAdded(device);
}

void DeviceRegistry::onLost(const QString &hostName)
{
    bool removed = false;
    {
        QWriteLocker locker(&m_lock);
        removed = m_devices.remove(hostName) > 0;
    }
    if (!removed)
        return;

    qCDebug(registryLog).noquote() << "Lost:" << hostName;
    emit deviceRemoved(hostName);
}

void DeviceRegistry::onLostDevice(const Device &device)
{
    qCDebug(registryLog).noquote() << "Lost event for" << device.hostName
                                   << QStringLiteral("(mac=%1, service=%2)").arg(device.macAddress, device.service);
    onLost(device.hostName);
}

} // namespace lumactl
