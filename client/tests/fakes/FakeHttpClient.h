#ifndef FAKEHTTPCLIENT_H
#define FAKEHTTPCLIENT_H

#include <QHash>
#include <QStringList>
#include "backend/network/HttpClient.h"

// HttpClient that answers from a table instead of the network. Unknown URLs fail with HTTP 404.
class FakeHttpClient : public HttpClient {
public:
    FakeHttpClient() : HttpClient(QStringLiteral("test-token"), 1000) {}

    QHash<QString, QByteArray> responses;   // full URL -> body
    QStringList requested;

    bool get(const QUrl& url, QByteArray* body, QString* errorMessage = nullptr) override {
        const QString key = url.toString(QUrl::FullyEncoded);
        requested.append(key);
        auto it = responses.constFind(key);
        if (it == responses.constEnd()) {
            if (errorMessage) *errorMessage = QStringLiteral("unexpected HTTP status 404");
            return false;
        }
        if (body) *body = it.value();
        return true;
    }
};

#endif // FAKEHTTPCLIENT_H
