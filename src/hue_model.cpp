#include "hue_model.h"

#include <algorithm>
#include <cmath>

#include <QHash>
#include <QJsonDocument>

namespace lumactl::hue {

namespace {

constexpr int kMinMirek = 153;
constexpr int kMaxMirek = 500;

QString ownerDeviceId(const QJsonObject &resourceObj)
{
    const QJsonObject ownerObj = resourceObj.value(QStringLiteral("owner")).toObject();
    if (ownerObj.value(QStringLiteral("rtype")).toString() != QStringLiteral("device"))
        return {};
    return ownerObj.value(QStringLiteral("rid")).toString().trimmed();
}

QString lightName(const QJsonObject &lightObj)
{
    const QJsonObject metadata = lightObj.value(QStringLiteral("metadata")).toObject();
    const QString name = metadata.value(QStringLiteral("name")).toString().trimmed();
    if (!name.isEmpty())
        return name;
    return lightObj.value(QStringLiteral("id")).toString().trimmed();
}

void insertDynamics(QJsonObject *body, int transitionMs)
{
    QJsonObject dynamicsObj;
    dynamicsObj.insert(QStringLiteral("duration"), std::max(0, transitionMs));
    body->insert(QStringLiteral("dynamics"), dynamicsObj);
}

} // namespace

QList<Device> buildDevices(const QJsonArray &lightData,
                           const QJsonArray &zigbeeConnectivityData,
                           int bridgePort)
{
    QHash<QString, QString> macByOwner;
    for (const QJsonValue &value : zigbeeConnectivityData) {
        const QJsonObject obj = value.toObject();
        const QString owner = ownerDeviceId(obj);
        const QString mac = obj.value(QStringLiteral("mac_address")).toString().trimmed();
        if (!owner.isEmpty() && !mac.isEmpty())
            macByOwner.insert(owner, mac.toLower());
    }

    QList<Device> devices;
    for (const QJsonValue &value : lightData) {
        if (!value.isObject())
            continue;
        const QJsonObject lightObj = value.toObject();
        const QString id = lightObj.value(QStringLiteral("id")).toString().trimmed();
        if (id.isEmpty())
            continue;

        Device device;
        device.hostName = lightName(lightObj);
        device.macAddress = macByOwner.value(ownerDeviceId(lightObj));
        device.service = QString::fromLatin1(kServiceType);
        device.port = bridgePort;
        device.resourceId = id;
        devices.append(device);
    }
    return devices;
}

LightState parseLightState(const QJsonObject &lightObj)
{
    LightState state;
    state.label = lightName(lightObj);
    state.on = lightObj.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(false);

    const QJsonObject dimmingObj = lightObj.value(QStringLiteral("dimming")).toObject();
    state.brightness = std::clamp(dimmingObj.value(QStringLiteral("brightness")).toDouble(0.0), 0.0, 100.0);

    const QJsonObject ctObj = lightObj.value(QStringLiteral("color_temperature")).toObject();
    const QJsonValue mirekValue = ctObj.value(QStringLiteral("mirek"));
    if (mirekValue.isDouble())
        state.kelvin = mirekToKelvin(mirekValue.toInt());

    const QJsonObject xyObj = lightObj.value(QStringLiteral("color")).toObject().value(QStringLiteral("xy")).toObject();
    if (!xyObj.isEmpty()) {
        const QColor color = xyToColor(xyObj.value(QStringLiteral("x")).toDouble(),
                                       xyObj.value(QStringLiteral("y")).toDouble());
        const double hue = color.hsvHueF();
        state.hue = hue < 0.0 ? 0.0 : hue * 360.0;
        state.saturation = color.hsvSaturationF() * 100.0;
    }

    return state;
}

QByteArray buildPowerPayload(bool on, int transitionMs)
{
    QJsonObject body;
    QJsonObject onObj;
    onObj.insert(QStringLiteral("on"), on);
    body.insert(QStringLiteral("on"), onObj);
    insertDynamics(&body, transitionMs);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

QByteArray buildColorPayload(const QColor &color, quint16 kelvin, int transitionMs)
{
    QJsonObject body;
    const double value = color.valueF();

    QJsonObject onObj;
    onObj.insert(QStringLiteral("on"), value > 0.0);
    body.insert(QStringLiteral("on"), onObj);

    if (value > 0.0) {
        QJsonObject dimObj;
        dimObj.insert(QStringLiteral("brightness"), std::clamp(value * 100.0, 0.0, 100.0));
        body.insert(QStringLiteral("dimming"), dimObj);
    }

    if (color.hsvSaturationF() <= 0.0 && kelvin > 0) {
        QJsonObject ctObj;
        ctObj.insert(QStringLiteral("mirek"), kelvinToMirek(kelvin));
        body.insert(QStringLiteral("color_temperature"), ctObj);
    } else if (value > 0.0) {
        double x = 0.0;
        double y = 0.0;
        rgbToXy(color.redF(), color.greenF(), color.blueF(), &x, &y);

        QJsonObject xyObj;
        xyObj.insert(QStringLiteral("x"), x);
        xyObj.insert(QStringLiteral("y"), y);

        QJsonObject colorObj;
        colorObj.insert(QStringLiteral("xy"), xyObj);
        body.insert(QStringLiteral("color"), colorObj);
    }

    insertDynamics(&body, transitionMs);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

int kelvinToMirek(int kelvin)
{
    if (kelvin <= 0)
        return kMaxMirek;
    const int mirek = static_cast<int>(std::lround(1000000.0 / kelvin));
    return std::clamp(mirek, kMinMirek, kMaxMirek);
}

int mirekToKelvin(int mirek)
{
    if (mirek <= 0)
        return 0;
    return static_cast<int>(std::lround(1000000.0 / mirek));
}

void rgbToXy(double r01, double g01, double b01, double *x, double *y)
{
    auto gamma = [](double value) {
        if (value <= 0.04045)
            return value / 12.92;
        return std::pow((value + 0.055) / 1.055, 2.4);
    };

    const double r = gamma(std::clamp(r01, 0.0, 1.0));
    const double g = gamma(std::clamp(g01, 0.0, 1.0));
    const double b = gamma(std::clamp(b01, 0.0, 1.0));

    const double X = r * 0.664511 + g * 0.154324 + b * 0.162028;
    const double Y = r * 0.283881 + g * 0.668433 + b * 0.047685;
    const double Z = r * 0.000088 + g * 0.072310 + b * 0.986039;

    const double sum = X + Y + Z;
    if (sum <= 0.0) {
        *x = 0.0;
        *y = 0.0;
        return;
    }

    *x = std::clamp(X / sum, 0.0, 1.0);
    *y = std::clamp(Y / sum, 0.0, 1.0);
}

QColor xyToColor(double x, double y)
{
    if (y <= 0.0)
        return QColor(Qt::white);

    const double Y = 1.0;
    const double X = (Y / y) * x;
    const double Z = (Y / y) * (1.0 - x - y);

    double r = X * 1.656492 - Y * 0.354851 - Z * 0.255038;
    double g = -X * 0.707196 + Y * 1.655397 + Z * 0.036152;
    double b = X * 0.051713 - Y * 0.121364 + Z * 1.011530;

    auto reverseGamma = [](double value) {
        if (value <= 0.0031308)
            return 12.92 * value;
        return 1.055 * std::pow(value, 1.0 / 2.4) - 0.055;
    };

    r = std::max(0.0, r);
    g = std::max(0.0, g);
    b = std::max(0.0, b);
    const double peak = std::max({r, g, b});
    if (peak > 1.0) {
        r /= peak;
        g /= peak;
        b /= peak;
    }

    return QColor::fromRgbF(static_cast<float>(std::clamp(reverseGamma(r), 0.0, 1.0)),
                            static_cast<float>(std::clamp(reverseGamma(g), 0.0, 1.0)),
                            static_cast<float>(std::clamp(reverseGamma(b), 0.0, 1.0)));
}

} // namespace lumactl::hue
