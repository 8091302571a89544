#include "hue_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

namespace lumactl::hue {

namespace {

constexpr int kCancelCheckMs = 50;
constexpr int kDefaultTimeoutMs = 10000;

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    const QString host = settings.host.trimmed();
    if (!host.isEmpty())
        return host;
    return settings.ip.trimmed();
}

int HttpClient::effectivePort(const ConnectionSettings &settings)
{
    if (settings.port > 0)
        return settings.port;
    return settings.useTls ? 443 : 80;
}

HttpResult HttpClient::get(const ConnectionSettings &settings,
                           const QString &path,
                           const CancellationToken &cancel) const
{
    return request(settings, QByteArrayLiteral("GET"), path, {}, cancel);
}

HttpResult HttpClient::putJson(const ConnectionSettings &settings,
                               const QString &path,
                               const QByteArray &payload,
                               const CancellationToken &cancel) const
{
    return request(settings, QByteArrayLiteral("PUT"), path, payload, cancel);
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    const QString host = effectiveHost(settings);
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Bridge host is empty");
        return false;
    }

    QUrl url;
    url.setScheme(settings.useTls ? QStringLiteral("https") : QStringLiteral("http"));
    url.setHost(host);
    url.setPort(effectivePort(settings));
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "lumactl/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!settings.appKey.isEmpty())
        out.setRawHeader("hue-application-key", settings.appKey.toUtf8());
    out.setTransferTimeout(settings.requestTimeoutMs > 0 ? settings.requestTimeoutMs : kDefaultTimeoutMs);

#if QT_CONFIG(ssl)
    if (settings.useTls) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
    }
#endif

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QString &path,
                               const QByteArray &payload,
                               const CancellationToken &cancel) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    if (cancel.isCancelled()) {
        result.cancelled = true;
        result.error = QStringLiteral("Request cancelled");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, !payload.isEmpty(), &requestObj, &result.error))
        return result;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(requestObj);
    else
        reply = m_manager->sendCustomRequest(requestObj, method, payload);

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QTimer cancelCheck;
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });
    QObject::connect(&cancelCheck, &QTimer::timeout, &loop, [&]() {
        if (cancel.isCancelled())
            loop.quit();
    });

    timer.start(settings.requestTimeoutMs > 0 ? settings.requestTimeoutMs : kDefaultTimeoutMs);
    cancelCheck.start(kCancelCheckMs);
    if (!reply->isFinished())
        loop.exec();

    if (!reply->isFinished() && cancel.isCancelled()) {
        reply->abort();
        reply->deleteLater();
        result.cancelled = true;
        result.error = QStringLiteral("Request cancelled");
        return result;
    }

    if (timedOut && !reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        result.timedOut = true;
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result = readReply(reply);
    reply->deleteLater();
    return result;
}

QNetworkReply *HttpClient::sendGet(const ConnectionSettings &settings,
                                   const QString &path,
                                   QString *error) const
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return nullptr;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, false, &requestObj, error))
        return nullptr;

    QNetworkReply *reply = m_manager->get(requestObj);
    if (!reply && error)
        *error = QStringLiteral("Failed to create network request");
    return reply;
}

HttpResult HttpClient::readReply(QNetworkReply *reply)
{
    HttpResult result;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300)
        result.ok = true;
    else
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    return result;
}

} // namespace lumactl::hue
