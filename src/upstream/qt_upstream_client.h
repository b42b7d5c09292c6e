#pragma once
#include "ports.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <optional>

class QNetworkReply;

class QtUpstreamClient : public IUpstreamClient {
public:
    explicit QtUpstreamClient(const QString& userAgent);

    void execute(const UpstreamRequest& request, ResponseCallback done) override;
    void executeAll(const QList<UpstreamRequest>& requests, BatchCallback done) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    int requestTimeout() const { return m_requestTimeout; }

private:
    QNetworkAccessManager m_nam;
    QString m_userAgent;
    int m_requestTimeout = 10000;

    QNetworkRequest buildQtRequest(const UpstreamRequest& request) const;
    Result<UpstreamResponse> collect(QNetworkReply* reply, bool timedOut) const;
    std::optional<DomainFailure> checkTransportError(QNetworkReply* reply) const;
};
