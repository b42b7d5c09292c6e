#include "upstream_errors.h"
#include "core/log_manager.h"

namespace upstream_errors {

DomainFailure transportFailure(const QString& sourceName, const DomainFailure& cause)
{
    LOG_WARNING(QStringLiteral("%1: upstream unreachable: %2").arg(sourceName, cause.message));
    return DomainFailure::unavailable(
        QStringLiteral("Could not connect to the %1 API.").arg(sourceName));
}

DomainFailure statusFailure(const UpstreamResponse& response, const StatusMessages& messages)
{
    if (response.statusCode == 404 && !messages.notFound.isEmpty()) {
        return DomainFailure::notFound(messages.notFound);
    }

    const QString body = QString::fromUtf8(response.body);
    const QString context = messages.context.isEmpty()
        ? QStringLiteral("Upstream request failed")
        : messages.context;
    return DomainFailure::upstream(response.statusCode,
                                   QStringLiteral("%1: %2").arg(context, body));
}

Result<UpstreamResponse> checked(const Result<UpstreamResponse>& result,
                                 const QString& sourceName,
                                 const StatusMessages& messages)
{
    if (!result) {
        return std::unexpected(transportFailure(sourceName, result.error()));
    }
    if (!result->isSuccess()) {
        LOG_DEBUG(QStringLiteral("%1: upstream %2 returned HTTP %3")
                      .arg(sourceName, result->url.toDisplayString())
                      .arg(result->statusCode));
        return std::unexpected(statusFailure(*result, messages));
    }
    return *result;
}

}
