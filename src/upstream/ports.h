#pragma once
#include "model/result.h"
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QString>
#include <QUrl>
#include <functional>

struct UpstreamRequest {
    QUrl url;
    QMap<QString, QString> headers;
};

struct UpstreamResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
    QUrl url;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

using ResponseCallback = std::function<void(Result<UpstreamResponse>)>;
using BatchCallback = std::function<void(QList<Result<UpstreamResponse>>)>;

// Performs GET requests against third-party APIs. A failure always means the
// transport failed (DNS, refused connection, timeout); any HTTP status,
// including errors, comes back as a response.
//
// Calls return immediately. The callback runs exactly once, from the event
// loop once the call settles, or before the call returns when the outcome is
// already known.
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    virtual void execute(const UpstreamRequest& request, ResponseCallback done) = 0;

    // Dispatches every request at once and calls done when the last one has
    // settled. The result list is parallel to the input list.
    virtual void executeAll(const QList<UpstreamRequest>& requests, BatchCallback done) = 0;
};
