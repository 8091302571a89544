#include <QtTest>

#include "device_registry.h"
#include "discovery_session.h"
#include "fake_light_control.h"

using namespace lumactl;
using lumactl::testing::FakeLightControl;
using lumactl::testing::makeDevice;

class DiscoverySessionTest : public QObject
{
    Q_OBJECT

private slots:
    void forwardsEventsWhileActive();
    void stopsExactlyOnce();
    void destructorStops();
    void failedStartLeavesNothingToStop();
};

void DiscoverySessionTest::forwardsEventsWhileActive()
{
    FakeLightControl control;
    DeviceRegistry registry;
    DiscoverySession session(control, registry);
    QVERIFY(session.start());

    control.announce(makeDevice(QStringLiteral("bulb1")));
    QVERIFY(registry.lookup(QStringLiteral("bulb1")).has_value());

    control.lose(makeDevice(QStringLiteral("bulb1")));
    QVERIFY(!registry.lookup(QStringLiteral("bulb1")).has_value());

    session.stop();
    control.announce(makeDevice(QStringLiteral("bulb2")));
    QCOMPARE(registry.size(), 0);
}

void DiscoverySessionTest::stopsExactlyOnce()
{
    FakeLightControl control;
    DeviceRegistry registry;
    {
        DiscoverySession session(control, registry);
        QVERIFY(session.start());
        QVERIFY(session.start());
        session.stop();
        session.stop();
    }
    QCOMPARE(control.startCount, 1);
    QCOMPARE(control.stopCount, 1);
}

void DiscoverySessionTest::destructorStops()
{
    FakeLightControl control;
    DeviceRegistry registry;
    {
        DiscoverySession session(control, registry);
        QVERIFY(session.start());
        QVERIFY(session.isActive());
    }
    QCOMPARE(control.stopCount, 1);
}

void DiscoverySessionTest::failedStartLeavesNothingToStop()
{
    FakeLightControl control;
    control.startError = QStringLiteral("Bridge host is empty");
    DeviceRegistry registry;
    {
        DiscoverySession session(control, registry);
        QString error;
        QVERIFY(!session.start(&error));
        QCOMPARE(error, QStringLiteral("Bridge host is empty"));
        QVERIFY(!session.isActive());

        control.announce(makeDevice(QStringLiteral("bulb1")));
        QCOMPARE(registry.size(), 0);
    }
    QCOMPARE(control.stopCount, 0);
}

QTEST_GUILESS_MAIN(DiscoverySessionTest)
#include "tst_discovery_session.moc"
