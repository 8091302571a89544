#pragma once

#include <QColor>
#include <QObject>
#include <QString>

#include "cancellation.h"
#include "light_types.h"

namespace lumactl {

// Device-control capability. Calls block the caller while a nested event loop
// runs; every call must return Cancelled once the token fires.
class LightControl : public QObject
{
    Q_OBJECT
public:
    explicit LightControl(QObject *parent = nullptr) : QObject(parent) {}
    ~LightControl() override = default;

    virtual bool startDiscovery(QString *error = nullptr) = 0;
    virtual void stopDiscovery() = 0;

    virtual LightStateResult queryLightState(const Device &device, const CancellationToken &cancel) = 0;
    virtual CmdResult setPower(const Device &device, bool on, int transitionMs,
                               const CancellationToken &cancel) = 0;
    virtual CmdResult setColor(const Device &device, const QColor &color, quint16 kelvin,
                               int transitionMs, const CancellationToken &cancel) = 0;

signals:
    void deviceDiscovered(const lumactl::Device &device);
    void deviceLost(const lumactl::Device &device);
};

} // namespace lumactl
