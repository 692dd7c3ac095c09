#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QUrl>

class QNetworkAccessManager;

/**
 * @brief Blocking GET helper for the media server.
 *
 * Every request carries the X-Plex-Token header and asks for JSON. The call
 * spins a local event loop so the window keeps receiving events while the
 * request is in flight, and aborts once the timeout expires.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    explicit HttpClient(const QString& authToken, int timeoutMs, QObject* parent = nullptr);
    ~HttpClient() override = default;

    // Returns false on network error, non-2xx status or timeout; errorMessage describes which.
    virtual bool get(const QUrl& url, QByteArray* body, QString* errorMessage = nullptr);

    int timeoutMs() const { return m_timeoutMs; }

private:
    QNetworkAccessManager* m_manager;
    QString m_authToken;
    int m_timeoutMs;
};

#endif // HTTPCLIENT_H
