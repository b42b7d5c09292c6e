#include "gateway_dispatcher.h"
#include "core/log_manager.h"
#include <QElapsedTimer>
#include <QUrlQuery>

namespace {

struct Target {
    QString path;
    QUrlQuery query;
};

Target splitTarget(const QString& target)
{
    Target result;
    const qsizetype questionMark = target.indexOf(QLatin1Char('?'));
    result.path = questionMark < 0 ? target : target.left(questionMark);
    if (questionMark >= 0) {
        // Form-style encoding: '+' stands for a space, a literal plus arrives as %2B.
        QString query = target.mid(questionMark + 1);
        query.replace(QLatin1Char('+'), QStringLiteral("%20"));
        result.query.setQuery(query);
    }
    if (result.path.isEmpty())
        result.path = QStringLiteral("/");
    return result;
}

}

GatewayDispatcher::GatewayDispatcher(const RouterRegistry& registry, const CorsPolicy& cors)
    : m_registry(registry)
    , m_cors(cors)
{
}

QJsonObject GatewayDispatcher::welcomeMessage()
{
    QJsonObject obj;
    obj[QStringLiteral("message")] = QStringLiteral("Welcome to the Aggregator API! All services are running.");
    return obj;
}

HttpResponse GatewayDispatcher::failureResponse(const DomainFailure& failure)
{
    return HttpResponse::json(failure.httpStatus(), failure.toJson());
}

void GatewayDispatcher::handle(const HttpRequest& request, ResponseReady done) const
{
    if (CorsPolicy::isPreflight(request)) {
        HttpResponse response = m_cors.preflight(request);
        LOG_INFO(QStringLiteral("%1 %2 -> %3 (preflight)")
                     .arg(request.method, request.target)
                     .arg(response.status));
        done(std::move(response));
        return;
    }

    QElapsedTimer elapsed;
    elapsed.start();

    route(request, [this, request, elapsed, done = std::move(done)](HttpResponse response) {
        m_cors.decorate(request, response);

        const QString line = QStringLiteral("%1 %2 -> %3 (%4 ms)")
                                 .arg(request.method, request.target)
                                 .arg(response.status)
                                 .arg(elapsed.elapsed());
        if (response.status >= 500)
            LOG_WARNING(line);
        else
            LOG_INFO(line);
        done(std::move(response));
    });
}

void GatewayDispatcher::route(const HttpRequest& request, ResponseReady done) const
{
    const Target target = splitTarget(request.target);
    const bool isGet = request.method == QStringLiteral("GET");

    if (target.path == QStringLiteral("/") || target.path == QStringLiteral("/features")
        || target.path == QStringLiteral("/features/")) {
        if (!isGet)
            done(failureResponse(DomainFailure::methodNotAllowed()));
        else if (target.path == QStringLiteral("/"))
            done(HttpResponse::json(200, welcomeMessage()));
        else
            done(HttpResponse::json(200, m_registry.features()));
        return;
    }

    const RouteLookup lookup = m_registry.match(request.method, target.path);
    if (!lookup.match) {
        if (lookup.pathKnown)
            done(failureResponse(DomainFailure::methodNotAllowed()));
        else
            done(failureResponse(DomainFailure::notFound(QStringLiteral("Not Found"))));
        return;
    }

    EndpointRequest endpointRequest;
    endpointRequest.pathParams = lookup.match->pathParams;
    endpointRequest.query = target.query;

    const QString path = target.path;
    lookup.match->endpoint.handler(endpointRequest, [path, done = std::move(done)](Result<QJsonValue> result) {
        if (!result) {
            LOG_DEBUG(QStringLiteral("GatewayDispatcher: %1 failed: %2")
                          .arg(path, result.error().message));
            done(failureResponse(result.error()));
            return;
        }
        done(HttpResponse::json(200, *result));
    });
}
