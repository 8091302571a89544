#pragma once

#include <QMetaType>
#include <QString>

namespace lumactl {

enum class CmdStatus {
    Success,
    InvalidArgument,
    MissingParameter,
    Timeout,
    Cancelled,
    NotSupported,
    DeviceFailure
};

QString cmdStatusName(CmdStatus status);

struct Device {
    QString hostName;
    QString macAddress;
    QString service;
    int port = 0;

    // Backend handle used to address the device.
    QString resourceId;

    bool operator==(const Device &other) const
    {
        return hostName == other.hostName
            && macAddress == other.macAddress
            && service == other.service
            && port == other.port
            && resourceId == other.resourceId;
    }
    bool operator!=(const Device &other) const { return !(*this == other); }
};

struct LightState {
    bool on = false;
    QString label;
    double brightness = 0.0;
    double saturation = 0.0;
    double hue = 0.0;
    int kelvin = 0;
};

struct CmdResult {
    CmdStatus status = CmdStatus::Success;
    QString error;

    bool ok() const { return status == CmdStatus::Success; }

    static CmdResult success() { return {}; }
    static CmdResult failure(CmdStatus status, const QString &error)
    {
        CmdResult result;
        result.status = status;
        result.error = error;
        return result;
    }
};

struct LightStateResult {
    CmdStatus status = CmdStatus::Success;
    QString error;
    LightState state;

    bool ok() const { return status == CmdStatus::Success; }
};

} // namespace lumactl

Q_DECLARE_METATYPE(lumactl::Device)
