#include "qt_upstream_client.h"
#include "core/log_manager.h"
#include <QElapsedTimer>
#include <QNetworkReply>
#include <QTimer>
#include <memory>
#include <utility>

QtUpstreamClient::QtUpstreamClient(const QString& userAgent)
    : m_userAgent(userAgent)
{
}

QNetworkRequest QtUpstreamClient::buildQtRequest(const UpstreamRequest& request) const {
    QNetworkRequest req{request.url};

    req.setHeader(QNetworkRequest::UserAgentHeader, m_userAgent);
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setTransferTimeout(m_requestTimeout);
    return req;
}

std::optional<DomainFailure> QtUpstreamClient::checkTransportError(QNetworkReply* reply) const {
    if (!reply) return DomainFailure::internal("null reply");

    // An HTTP status means the upstream answered; status errors are the caller's to map.
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid() && status.toInt() > 0)
        return std::nullopt;
    if (reply->error() == QNetworkReply::NoError)
        return std::nullopt;

    return DomainFailure::unavailable(reply->errorString());
}

Result<UpstreamResponse> QtUpstreamClient::collect(QNetworkReply* reply, bool timedOut) const {
    if (timedOut && reply->error() == QNetworkReply::OperationCanceledError) {
        return std::unexpected(DomainFailure::unavailable("request timeout"));
    }

    auto err = checkTransportError(reply);
    if (err) {
        return std::unexpected(*err);
    }

    UpstreamResponse resp;
    resp.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    resp.body = reply->readAll();
    resp.url = reply->url();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header).toLower()] = QString::fromUtf8(reply->rawHeader(header));
    return resp;
}

void QtUpstreamClient::execute(const UpstreamRequest& request, ResponseCallback done) {
    executeAll({request}, [done = std::move(done)](QList<Result<UpstreamResponse>> results) {
        done(results.first());
    });
}

namespace {

// Shared by the finished handlers of one batch; the last one to run settles it.
struct PendingBatch {
    QList<QNetworkReply*> replies;
    int pending = 0;
    bool timedOut = false;
    QTimer guard;
    QElapsedTimer elapsed;
    BatchCallback done;
};

}

void QtUpstreamClient::executeAll(const QList<UpstreamRequest>& requests, BatchCallback done) {
    if (requests.isEmpty()) {
        done({});
        return;
    }

    auto batch = std::make_shared<PendingBatch>();
    batch->done = std::move(done);
    batch->pending = static_cast<int>(requests.size());
    batch->elapsed.start();

    for (const UpstreamRequest& request : requests) {
        LOG_DEBUG(QStringLiteral("QtUpstreamClient: GET %1")
                      .arg(request.url.toDisplayString(QUrl::RemoveUserInfo)));
        batch->replies.append(m_nam.get(buildQtRequest(request)));
    }

    for (QNetworkReply* reply : std::as_const(batch->replies)) {
        QObject::connect(reply, &QNetworkReply::finished, reply, [this, batch]() {
            if (--batch->pending > 0)
                return;

            batch->guard.stop();
            QList<Result<UpstreamResponse>> results;
            for (QNetworkReply* settled : std::as_const(batch->replies)) {
                results.append(collect(settled, batch->timedOut));
                settled->deleteLater();
            }
            LOG_DEBUG(QStringLiteral("QtUpstreamClient: %1 request(s) settled in %2 ms")
                          .arg(results.size())
                          .arg(batch->elapsed.elapsed()));
            batch->done(std::move(results));
        });
    }

    // Per-reply transfer timeouts normally fire first; this only guards the batch.
    batch->guard.setSingleShot(true);
    QObject::connect(&batch->guard, &QTimer::timeout,
                     [weak = std::weak_ptr<PendingBatch>(batch)]() {
        const auto locked = weak.lock();
        if (!locked)
            return;
        locked->timedOut = true;
        const QList<QNetworkReply*> replies = locked->replies;
        for (QNetworkReply* reply : replies) {
            if (reply->isRunning())
                reply->abort();
        }
    });
    batch->guard.start(m_requestTimeout + 1000);
}
