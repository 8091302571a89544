#pragma once

#include <QByteArray>
#include <QColor>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "light_types.h"

namespace lumactl::hue {

inline constexpr const char kServiceType[] = "_hue._tcp";

// One Device per light resource. The light's name is its host name; the MAC
// comes from the zigbee_connectivity resource owned by the same device.
QList<Device> buildDevices(const QJsonArray &lightData,
                           const QJsonArray &zigbeeConnectivityData,
                           int bridgePort);

LightState parseLightState(const QJsonObject &lightObj);

QByteArray buildPowerPayload(bool on, int transitionMs);
QByteArray buildColorPayload(const QColor &color, quint16 kelvin, int transitionMs);

int kelvinToMirek(int kelvin);
int mirekToKelvin(int mirek);

void rgbToXy(double r01, double g01, double b01, double *x, double *y);
QColor xyToColor(double x, double y);

} // namespace lumactl::hue
