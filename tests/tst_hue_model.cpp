#include <QtTest>

#include <QJsonDocument>

#include "hue_model.h"

using namespace lumactl;
using namespace lumactl::hue;

class HueModelTest : public QObject
{
    Q_OBJECT

private slots:
    void devicesFromLights();
    void lightStateFromResource();
    void powerPayload();
    void colorPayloadUsesXy();
    void whitePayloadUsesColorTemperature();
    void blackPayloadTurnsOff();
    void mirekConversion();
    void xyRoundTripKeepsHue();
};

namespace {

QJsonObject parseObject(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}

QJsonArray parseArray(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).array();
}

} // namespace

void HueModelTest::devicesFromLights()
{
    const QJsonArray lights = parseArray(R"([
        {"id": "l-1", "owner": {"rid": "d-1", "rtype": "device"}, "metadata": {"name": "Kitchen"}},
        {"id": "l-2", "owner": {"rid": "d-2", "rtype": "device"}, "metadata": {"name": ""}},
        {"owner": {"rid": "d-3", "rtype": "device"}}
    ])");
    const QJsonArray connectivity = parseArray(R"([
        {"id": "z-1", "owner": {"rid": "d-1", "rtype": "device"}, "mac_address": "00:17:88:01:0A:BB:CC:DD"}
    ])");

    const QList<Device> devices = buildDevices(lights, connectivity, 443);
    QCOMPARE(devices.size(), 2);
    QCOMPARE(devices.at(0).hostName, QStringLiteral("Kitchen"));
    QCOMPARE(devices.at(0).macAddress, QStringLiteral("00:17:88:01:0a:bb:cc:dd"));
    QCOMPARE(devices.at(0).service, QStringLiteral("_hue._tcp"));
    QCOMPARE(devices.at(0).port, 443);
    QCOMPARE(devices.at(0).resourceId, QStringLiteral("l-1"));
    QCOMPARE(devices.at(1).hostName, QStringLiteral("l-2"));
    QVERIFY(devices.at(1).macAddress.isEmpty());
}

void HueModelTest::lightStateFromResource()
{
    const LightState state = parseLightState(parseObject(R"({
        "id": "l-1", "metadata": {"name": "Desk"}, "on": {"on": true},
        "dimming": {"brightness": 42.5},
        "color_temperature": {"mirek": 250},
        "color": {"xy": {"x": 0.6915, "y": 0.3083}}
    })"));

    QVERIFY(state.on);
    QCOMPARE(state.label, QStringLiteral("Desk"));
    QCOMPARE(state.brightness, 42.5);
    QCOMPARE(state.kelvin, 4000);
    QVERIFY(state.saturation > 80.0);
    QVERIFY(state.hue < 20.0 || state.hue > 340.0);
}

void HueModelTest::powerPayload()
{
    const QJsonObject body = parseObject(buildPowerPayload(false, 300));
    QCOMPARE(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(true), false);
    QCOMPARE(body.value(QStringLiteral("dynamics")).toObject().value(QStringLiteral("duration")).toInt(), 300);
}

void HueModelTest::colorPayloadUsesXy()
{
    const QJsonObject body = parseObject(buildColorPayload(QColor(0, 255, 0), 3500, 500));
    QVERIFY(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool());
    QCOMPARE(body.value(QStringLiteral("dimming")).toObject().value(QStringLiteral("brightness")).toDouble(), 100.0);
    QVERIFY(!body.contains(QStringLiteral("color_temperature")));

    const QJsonObject xy = body.value(QStringLiteral("color")).toObject().value(QStringLiteral("xy")).toObject();
    double x = 0.0;
    double y = 0.0;
    rgbToXy(0.0, 1.0, 0.0, &x, &y);
    QCOMPARE(xy.value(QStringLiteral("x")).toDouble(), x);
    QCOMPARE(xy.value(QStringLiteral("y")).toDouble(), y);
    QCOMPARE(body.value(QStringLiteral("dynamics")).toObject().value(QStringLiteral("duration")).toInt(), 500);
}

void HueModelTest::whitePayloadUsesColorTemperature()
{
    const QJsonObject body = parseObject(buildColorPayload(QColor(Qt::white), 2700, 0));
    QCOMPARE(body.value(QStringLiteral("color_temperature")).toObject().value(QStringLiteral("mirek")).toInt(), 370);
    QVERIFY(!body.contains(QStringLiteral("color")));
}

void HueModelTest::blackPayloadTurnsOff()
{
    const QJsonObject body = parseObject(buildColorPayload(QColor(Qt::black), 3500, 0));
    QCOMPARE(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(true), false);
    QVERIFY(!body.contains(QStringLiteral("dimming")));
    QVERIFY(!body.contains(QStringLiteral("color")));
}

void HueModelTest::mirekConversion()
{
    QCOMPARE(kelvinToMirek(6500), 154);
    QCOMPARE(kelvinToMirek(10000), 153);
    QCOMPARE(kelvinToMirek(1000), 500);
    QCOMPARE(kelvinToMirek(0), 500);
    QCOMPARE(mirekToKelvin(200), 5000);
    QCOMPARE(mirekToKelvin(0), 0);
}

void HueModelTest::xyRoundTripKeepsHue()
{
    double x = 0.0;
    double y = 0.0;
    rgbToXy(0.0, 0.0, 1.0, &x, &y);
    const QColor blue = xyToColor(x, y);
    QVERIFY(blue.blue() > blue.red());
    QVERIFY(blue.blue() > blue.green());
}

QTEST_GUILESS_MAIN(HueModelTest)
#include "tst_hue_model.moc"
