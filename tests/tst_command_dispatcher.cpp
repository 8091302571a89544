#include <QtTest>

#include "command_dispatcher.h"
#include "fake_light_control.h"

using namespace lumactl;
using lumactl::testing::FakeLightControl;
using lumactl::testing::makeDevice;

class CommandDispatcherTest : public QObject
{
    Q_OBJECT

private slots:
    void powerTokens();
    void onWhenAlreadyOnIsSkipped();
    void onWhenOffSendsPowerOn();
    void offWhenAlreadyOffIsSkipped();
    void offWhenOnSendsPowerOff();
    void toggleFromOffTurnsOn();
    void toggleFromOnTurnsOff();
    void colorIsAlwaysSent();
    void unsupportedIsRejectedWithoutQuery();
    void queryFailurePropagates();
    void commandFailurePropagates();
    void cancelledBeforeQuery();
};

void CommandDispatcherTest::powerTokens()
{
    QCOMPARE(DesiredState::fromPowerToken(QStringLiteral("on")).kind, DesiredState::Kind::PowerOn);
    QCOMPARE(DesiredState::fromPowerToken(QStringLiteral("off")).kind, DesiredState::Kind::PowerOff);
    QCOMPARE(DesiredState::fromPowerToken(QStringLiteral("toggle")).kind, DesiredState::Kind::Toggle);
    QCOMPARE(DesiredState::fromPowerToken(QStringLiteral("ON")).kind, DesiredState::Kind::Unsupported);
    QCOMPARE(DesiredState::fromPowerToken(QStringLiteral("on")).transitionMs, 0);
}

void CommandDispatcherTest::onWhenAlreadyOnIsSkipped()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = true;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("on")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Skipped);
    QCOMPARE(outcome.reason, QStringLiteral("already on"));
    QCOMPARE(control.queried.size(), 1);
    QVERIFY(control.powerCalls.isEmpty());
    QVERIFY(control.colorCalls.isEmpty());
}

void CommandDispatcherTest::onWhenOffSendsPowerOn()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = false;
    control.state.label = QStringLiteral("Desk");

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("on"), 250));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Applied);
    QCOMPARE(outcome.label, QStringLiteral("Desk"));
    QCOMPARE(control.powerCalls.size(), 1);
    QVERIFY(control.powerCalls.first().on);
    QCOMPARE(control.powerCalls.first().transitionMs, 250);
}

void CommandDispatcherTest::offWhenAlreadyOffIsSkipped()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = false;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("off")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Skipped);
    QCOMPARE(outcome.reason, QStringLiteral("already off"));
    QVERIFY(control.powerCalls.isEmpty());
}

void CommandDispatcherTest::offWhenOnSendsPowerOff()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = true;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("off")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Applied);
    QCOMPARE(control.powerCalls.size(), 1);
    QVERIFY(!control.powerCalls.first().on);
}

void CommandDispatcherTest::toggleFromOffTurnsOn()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = false;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("toggle")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Applied);
    QCOMPARE(control.powerCalls.size(), 1);
    QVERIFY(control.powerCalls.first().on);
}

void CommandDispatcherTest::toggleFromOnTurnsOff()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = true;

    CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("toggle")));
    QCOMPARE(control.powerCalls.size(), 1);
    QVERIFY(!control.powerCalls.first().on);
}

void CommandDispatcherTest::colorIsAlwaysSent()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.state.on = true;

    CommandDispatcher dispatcher(control, cancel);
    const DesiredState desired = DesiredState::setColor(QColor(0, 255, 0), 3500, 500);
    QCOMPARE(dispatcher.dispatch(makeDevice(QStringLiteral("bulb1")), desired).result,
             DispatchOutcome::Result::Applied);
    QCOMPARE(dispatcher.dispatch(makeDevice(QStringLiteral("bulb1")), desired).result,
             DispatchOutcome::Result::Applied);

    QCOMPARE(control.colorCalls.size(), 2);
    QCOMPARE(control.colorCalls.first().color, QColor(0, 255, 0));
    QCOMPARE(control.colorCalls.first().kelvin, quint16(3500));
    QCOMPARE(control.colorCalls.first().transitionMs, 500);
    QVERIFY(control.powerCalls.isEmpty());
}

void CommandDispatcherTest::unsupportedIsRejectedWithoutQuery()
{
    FakeLightControl control;
    CancellationToken cancel;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("dim")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Rejected);
    QCOMPARE(outcome.reason, QStringLiteral("unsupported state"));
    QVERIFY(outcome.ok());
    QVERIFY(control.queried.isEmpty());
    QVERIFY(control.powerCalls.isEmpty());
}

void CommandDispatcherTest::queryFailurePropagates()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.queryStatus = CmdStatus::DeviceFailure;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("on")));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Failed);
    QCOMPARE(outcome.status, CmdStatus::DeviceFailure);
    QCOMPARE(outcome.reason, QStringLiteral("query failed"));
    QVERIFY(control.powerCalls.isEmpty());
}

void CommandDispatcherTest::commandFailurePropagates()
{
    FakeLightControl control;
    CancellationToken cancel;
    control.commandStatus = CmdStatus::DeviceFailure;

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::setColor(QColor(Qt::red), 2700));
    QCOMPARE(outcome.result, DispatchOutcome::Result::Failed);
    QCOMPARE(outcome.status, CmdStatus::DeviceFailure);
    QCOMPARE(control.colorCalls.size(), 1);
}

void CommandDispatcherTest::cancelledBeforeQuery()
{
    FakeLightControl control;
    CancellationToken cancel;
    cancel.cancel();

    const DispatchOutcome outcome = CommandDispatcher(control, cancel)
        .dispatch(makeDevice(QStringLiteral("bulb1")), DesiredState::fromPowerToken(QStringLiteral("toggle")));
    QCOMPARE(outcome.status, CmdStatus::Cancelled);
    QVERIFY(control.queried.isEmpty());
    QVERIFY(control.powerCalls.isEmpty());
}

QTEST_GUILESS_MAIN(CommandDispatcherTest)
#include "tst_command_dispatcher.moc"
