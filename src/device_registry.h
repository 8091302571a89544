#pragma once

#include <optional>

#include <QList>
#include <QMap>
#include <QObject>
#include <QReadWriteLock>
#include <QString>

#include "light_types.h"

namespace lumactl {

// Live devices keyed by host name. Mutated only through the discovery slots;
// safe to read from any thread while a discovery source writes.
class DeviceRegistry : public QObject
{
    Q_OBJECT
public:
    explicit DeviceRegistry(QObject *parent = nullptr);

    std::optional<Device> lookup(const QString &hostName) const;
    QList<Device> devices() const;
    int size() const;

public slots:
    void onDiscovered(const lumactl::Device &device);
    void onLost(const QString &hostName);
    void onLostDevice(const lumactl::Device &device);

signals:
    void deviceAdded(const lumactl::Device &device);
    void deviceRemoved(const QString &hostName);

private:
    mutable QReadWriteLock m_lock;
    QMap<QString, Device> m_devices;
};

} // namespace lumactl
