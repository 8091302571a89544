#pragma once

#include <QString>

namespace lumactl {

class DeviceRegistry;
class LightControl;

// Owns one running discovery on a LightControl. Discovery and loss signals
// are forwarded to the registry while active; the destructor stops it.
class DiscoverySession
{
public:
    DiscoverySession(LightControl &control, DeviceRegistry &registry);
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession &) = delete;
    DiscoverySession &operator=(const DiscoverySession &) = delete;

    bool start(QString *error = nullptr);
    void stop();

    bool isActive() const { return m_active; }

private:
    LightControl &m_control;
    DeviceRegistry &m_registry;
    bool m_active = false;
};

} // namespace lumactl
