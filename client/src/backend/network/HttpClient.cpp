#include "backend/network/HttpClient.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QTimer>
#include <QDebug>

HttpClient::HttpClient(const QString& authToken, int timeoutMs, QObject* parent)
    : QObject(parent)
    , m_manager(new QNetworkAccessManager(this))
    , m_authToken(authToken)
    , m_timeoutMs(timeoutMs)
{
}

bool HttpClient::get(const QUrl& url, QByteArray* body, QString* errorMessage) {
    if (!url.isValid()) {
        if (errorMessage) *errorMessage = QStringLiteral("invalid URL");
        return false;
    }

    QNetworkRequest request(url);
    request.setRawHeader("Accept", "application/json");
    request.setRawHeader("X-Plex-Token", m_authToken.toUtf8());
    request.setRawHeader("X-Plex-Product", "Marquee");
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkReply* reply = m_manager->get(request);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    bool timedOut = false;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timeout, &QTimer::timeout, &loop, [&timedOut, reply]() {
        timedOut = true;
        reply->abort();
    });
    timeout.start(m_timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    timeout.stop();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    bool ok = false;
    if (timedOut) {
        if (errorMessage) *errorMessage = QStringLiteral("timed out after %1 ms").arg(m_timeoutMs);
    } else if (reply->error() != QNetworkReply::NoError) {
        if (errorMessage) {
            *errorMessage = status > 0
                ? QStringLiteral("HTTP %1: %2").arg(status).arg(reply->errorString())
                : reply->errorString();
        }
    } else if (status < 200 || status >= 300) {
        if (errorMessage) *errorMessage = QStringLiteral("unexpected HTTP status %1").arg(status);
    } else {
        if (body) *body = reply->readAll();
        ok = true;
    }

    reply->deleteLater();
    return ok;
}
