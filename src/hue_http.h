#pragma once

#include <QByteArray>
#include <QString>

#include "cancellation.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace lumactl::hue {

struct ConnectionSettings {
    QString host;
    QString ip;
    int port = 0;
    bool useTls = true;
    QString appKey;
    int requestTimeoutMs = 10000;
};

struct HttpResult {
    bool ok = false;
    bool cancelled = false;
    bool timedOut = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

// Bridge requests. get() and putJson() block in a local event loop until the
// reply finishes, the request times out or the token is cancelled.
// sendGet() returns the in-flight reply for callers that handle finished().
class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   const CancellationToken &cancel) const;

    HttpResult putJson(const ConnectionSettings &settings,
                       const QString &path,
                       const QByteArray &payload,
                       const CancellationToken &cancel) const;

    QNetworkReply *sendGet(const ConnectionSettings &settings,
                           const QString &path,
                           QString *error = nullptr) const;

    // Converts a finished reply; the caller keeps ownership.
    static HttpResult readReply(QNetworkReply *reply);

    static QString effectiveHost(const ConnectionSettings &settings);
    static int effectivePort(const ConnectionSettings &settings);

private:
    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QString &path,
                       const QByteArray &payload,
                       const CancellationToken &cancel) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace lumactl::hue
