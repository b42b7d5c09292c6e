#pragma once
#include "adapters/source_adapter.h"
#include <QTest>
#include <memory>
#include <optional>

// Invokes the endpoint registered under pattern, bypassing the router, and
// waits for its reply.
inline Result<QJsonValue> callEndpoint(ISourceAdapter& adapter,
                                       const QString& pattern,
                                       const QMap<QString, QString>& pathParams = {},
                                       const QString& query = QString())
{
    const QList<Endpoint> endpoints = adapter.endpoints();
    for (const Endpoint& endpoint : endpoints) {
        if (endpoint.pattern != pattern)
            continue;
        EndpointRequest request;
        request.pathParams = pathParams;
        request.query = QUrlQuery(query);

        auto outcome = std::make_shared<std::optional<Result<QJsonValue>>>();
        endpoint.handler(request, [outcome](Result<QJsonValue> result) {
            outcome->emplace(std::move(result));
        });
        if (!outcome->has_value() && !QTest::qWaitFor([&outcome]() { return outcome->has_value(); }, 5000))
            return std::unexpected(DomainFailure::internal(QStringLiteral("No reply from %1").arg(pattern)));
        return **outcome;
    }
    return std::unexpected(DomainFailure::internal(QStringLiteral("No endpoint %1").arg(pattern)));
}
