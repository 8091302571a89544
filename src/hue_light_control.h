#pragma once

#include <QHash>
#include <QJsonArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QPointer>
#include <QTimer>

#include "hue_http.h"
#include "light_control.h"

namespace lumactl::hue {

// LightControl backed by a Hue bridge (CLIP v2). Discovery polls the bridge's
// light list without blocking and reports additions, renames and removals as
// signals. Lights are tracked by resource id but reported by name.
class HueLightControl final : public LightControl
{
    Q_OBJECT
public:
    HueLightControl(const ConnectionSettings &settings,
                    int pollIntervalMs,
                    const CancellationToken &discoveryCancel,
                    QObject *parent = nullptr);
    ~HueLightControl() override;

    bool startDiscovery(QString *error = nullptr) override;
    void stopDiscovery() override;

    LightStateResult queryLightState(const Device &device, const CancellationToken &cancel) override;
    CmdResult setPower(const Device &device, bool on, int transitionMs,
                       const CancellationToken &cancel) override;
    CmdResult setColor(const Device &device, const QColor &color, quint16 kelvin,
                       int transitionMs, const CancellationToken &cancel) override;

private slots:
    void refreshDevices();

private:
    using FetchHandler = void (HueLightControl::*)(const HttpResult &);

    bool startFetch(const QString &resourcePath, FetchHandler handler);
    void onLightsFetched(const HttpResult &result);
    void onConnectivityFetched(const HttpResult &result);
    void applyDevices(const QList<Device> &devices);
    void releaseName(const Device &device);
    QString otherLightNamed(const QString &hostName, const QString &resourceId) const;
    void dropAllDevices();

    static bool parseResourceArray(const QString &resourcePath, const HttpResult &result,
                                   QJsonArray *outData, QString *error = nullptr);
    CmdResult putLight(const Device &device, const QByteArray &payload, const CancellationToken &cancel);

    static CmdStatus statusFor(const HttpResult &result);

    QNetworkAccessManager m_network;
    HttpClient m_http;
    ConnectionSettings m_settings;
    const CancellationToken &m_discoveryCancel;

    QTimer m_pollTimer;
    bool m_discovering = false;
    QPointer<QNetworkReply> m_refreshReply;
    QJsonArray m_pendingLights;
    QHash<QString, Device> m_known;
};

} // namespace lumactl::hue
