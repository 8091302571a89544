#include "hue_light_control.h"

#include <algorithm>

#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QSet>

#include "hue_model.h"

namespace lumactl::hue {

Q_LOGGING_CATEGORY(hueLog, "lumactl.hue")

namespace {

constexpr int kMinPollIntervalMs = 250;

QString extractHueError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject())
        return {};

    const QJsonArray errors = doc.object().value(QStringLiteral("errors")).toArray();
    if (!errors.isEmpty()) {
        const QString description = errors.first().toObject().value(QStringLiteral("description")).toString();
        if (!description.isEmpty())
            return description;
    }

    return {};
}

QString describeFailure(const HttpResult &result, const QString &fallback)
{
    QString message = extractHueError(result.payload);
    if (message.isEmpty())
        message = result.error;
    if (message.isEmpty())
        message = fallback;
    return message;
}

} // namespace

HueLightControl::HueLightControl(const ConnectionSettings &settings,
                                 int pollIntervalMs,
                                 const CancellationToken &discoveryCancel,
                                 QObject *parent)
    : LightControl(parent)
    , m_http(&m_network)
    , m_settings(settings)
    , m_discoveryCancel(discoveryCancel)
{
    m_pollTimer.setInterval(std::max(kMinPollIntervalMs, pollIntervalMs));
    connect(&m_pollTimer, &QTimer::timeout, this, &HueLightControl::refreshDevices);
}

HueLightControl::~HueLightControl()
{
    stopDiscovery();
}

bool HueLightControl::startDiscovery(QString *error)
{
    if (HttpClient::effectiveHost(m_settings).isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return false;
    }
    if (m_settings.appKey.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Hue application key missing");
        return false;
    }

    if (!m_discovering) {
        m_discovering = true;
        qCDebug(hueLog) << "Starting discovery on bridge" << HttpClient::effectiveHost(m_settings)
                        << "every" << m_pollTimer.interval() << "ms";
        QTimer::singleShot(0, this, &HueLightControl::refreshDevices);
        m_pollTimer.start();
    }

    if (error)
        error->clear();
    return true;
}

void HueLightControl::stopDiscovery()
{
    if (!m_discovering)
        return;

    m_discovering = false;
    m_pollTimer.stop();
    if (m_refreshReply)
        m_refreshReply->abort();
    m_pendingLights = QJsonArray{};
    m_known.clear();
    qCDebug(hueLog) << "Discovery stopped";
}

void HueLightControl::refreshDevices()
{
    if (!m_discovering || m_refreshReply || m_discoveryCancel.isCancelled())
        return;

    if (!startFetch(QStringLiteral("light"), &HueLightControl::onLightsFetched))
        dropAllDevices();
}

bool HueLightControl::startFetch(const QString &resourcePath, FetchHandler handler)
{
    QString error;
    QNetworkReply *reply = m_http.sendGet(m_settings,
                                          QStringLiteral("/clip/v2/resource/%1").arg(resourcePath),
                                          &error);
    if (!reply) {
        qCWarning(hueLog).noquote() << "Hue" << resourcePath << "request failed:" << error;
        return false;
    }

    m_refreshReply = reply;
    connect(reply, &QNetworkReply::finished, this, [this, reply, handler]() {
        if (m_refreshReply == reply)
            m_refreshReply.clear();
        const HttpResult result = HttpClient::readReply(reply);
        reply->deleteLater();

        // Stopped or cancelled while the request was in flight.
        if (!m_discovering || m_discoveryCancel.isCancelled())
            return;
        (this->*handler)(result);
    });
    return true;
}

void HueLightControl::onLightsFetched(const HttpResult &result)
{
    QJsonArray lightData;
    QString error;
    if (!parseResourceArray(QStringLiteral("light"), result, &lightData, &error)) {
        qCWarning(hueLog).noquote() << "Light refresh failed:" << error;
        dropAllDevices();
        return;
    }

    m_pendingLights = lightData;
    if (!startFetch(QStringLiteral("zigbee_connectivity"), &HueLightControl::onConnectivityFetched))
        applyDevices(buildDevices(m_pendingLights, QJsonArray{}, HttpClient::effectivePort(m_settings)));
}

void HueLightControl::onConnectivityFetched(const HttpResult &result)
{
    QJsonArray connectivityData;
    QString error;
    if (!parseResourceArray(QStringLiteral("zigbee_connectivity"), result, &connectivityData, &error)) {
        qCDebug(hueLog).noquote() << "No connectivity data, MAC addresses unknown:" << error;
        connectivityData = QJsonArray{};
    }

    const QJsonArray lightData = m_pendingLights;
    m_pendingLights = QJsonArray{};
    applyDevices(buildDevices(lightData, connectivityData, HttpClient::effectivePort(m_settings)));
}

void HueLightControl::applyDevices(const QList<Device> &devices)
{
    QSet<QString> seen;
    for (const Device &device : devices) {
        seen.insert(device.resourceId);
        const auto it = m_known.constFind(device.resourceId);
        if (it != m_known.constEnd() && it.value() == device)
            continue;

        const bool renamed = it != m_known.constEnd() && it.value().hostName != device.hostName;
        const Device previous = it != m_known.constEnd() ? it.value() : Device{};
        m_known.insert(device.resourceId, device);
        if (renamed)
            releaseName(previous);

        const QString clash = otherLightNamed(device.hostName, device.resourceId);
        if (!clash.isEmpty())
            qCWarning(hueLog).noquote()
                << QStringLiteral("Lights %1 and %2 are both named '%3'; commands reach only one of them")
                       .arg(clash, device.resourceId, device.hostName);
        emit deviceDiscovered(device);
    }

    for (auto it = m_known.begin(); it != m_known.end();) {
        if (seen.contains(it.key())) {
            ++it;
            continue;
        }
        const Device lost = it.value();
        it = m_known.erase(it);
        releaseName(lost);
    }
}

// A name stays registered while another light still carries it; that light
// then takes the entry over.
void HueLightControl::releaseName(const Device &device)
{
    const QString other = otherLightNamed(device.hostName, device.resourceId);
    if (other.isEmpty()) {
        emit deviceLost(device);
        return;
    }
    emit deviceDiscovered(m_known.value(other));
}

QString HueLightControl::otherLightNamed(const QString &hostName, const QString &resourceId) const
{
    for (auto it = m_known.cbegin(); it != m_known.cend(); ++it) {
        if (it.key() != resourceId && it.value().hostName == hostName)
            return it.key();
    }
    return {};
}

void HueLightControl::dropAllDevices()
{
    const QList<Device> known = m_known.values();
    m_known.clear();
    QSet<QString> names;
    for (const Device &device : known) {
        if (names.contains(device.hostName))
            continue;
        names.insert(device.hostName);
        emit deviceLost(device);
    }
}

bool HueLightControl::parseResourceArray(const QString &resourcePath,
                                         const HttpResult &result,
                                         QJsonArray *outData,
                                         QString *error)
{
    if (!result.ok) {
        if (error)
            *error = describeFailure(result, QStringLiteral("Failed to fetch Hue resource %1").arg(resourcePath));
        return false;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Hue %1 response is not a JSON object").arg(resourcePath);
        return false;
    }

    const QJsonValue data = doc.object().value(QStringLiteral("data"));
    if (!data.isArray()) {
        if (error)
            *error = QStringLiteral("Hue %1 response has no data array").arg(resourcePath);
        return false;
    }

    *outData = data.toArray();
    if (error)
        error->clear();
    return true;
}

LightStateResult HueLightControl::queryLightState(const Device &device, const CancellationToken &cancel)
{
    LightStateResult out;

    const HttpResult result = m_http.get(m_settings,
                                         QStringLiteral("/clip/v2/resource/light/%1").arg(device.resourceId),
                                         cancel);
    if (!result.ok) {
        out.status = statusFor(result);
        out.error = describeFailure(result, QStringLiteral("Failed to query %1").arg(device.hostName));
        return out;
    }

    const QJsonArray data = QJsonDocument::fromJson(result.payload).object().value(QStringLiteral("data")).toArray();
    if (data.isEmpty() || !data.first().isObject()) {
        out.status = CmdStatus::DeviceFailure;
        out.error = QStringLiteral("Hue bridge returned no state for %1").arg(device.hostName);
        return out;
    }

    out.state = parseLightState(data.first().toObject());
    return out;
}

CmdResult HueLightControl::setPower(const Device &device, bool on, int transitionMs,
                                    const CancellationToken &cancel)
{
    return putLight(device, buildPowerPayload(on, transitionMs), cancel);
}

CmdResult HueLightControl::setColor(const Device &device, const QColor &color, quint16 kelvin,
                                    int transitionMs, const CancellationToken &cancel)
{
    return putLight(device, buildColorPayload(color, kelvin, transitionMs), cancel);
}

CmdResult HueLightControl::putLight(const Device &device, const QByteArray &payload,
                                    const CancellationToken &cancel)
{
    qCDebug(hueLog).noquote() << "PUT light" << device.resourceId << payload;
    const HttpResult result = m_http.putJson(m_settings,
                                             QStringLiteral("/clip/v2/resource/light/%1").arg(device.resourceId),
                                             payload,
                                             cancel);
    if (!result.ok)
        return CmdResult::failure(statusFor(result),
                                  describeFailure(result, QStringLiteral("Hue command for %1 failed").arg(device.hostName)));
    return CmdResult::success();
}

CmdStatus HueLightControl::statusFor(const HttpResult &result)
{
    if (result.cancelled)
        return CmdStatus::Cancelled;
    return CmdStatus::DeviceFailure;
}

} // namespace lumactl::hue
