#include "cors_policy.h"

namespace {

const QString kAllowedMethods = QStringLiteral("DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT");
const QString kMaxAge = QStringLiteral("600");

}

CorsPolicy::CorsPolicy(const QStringList& allowedOrigins)
    : m_allowedOrigins(allowedOrigins)
    , m_allowAny(allowedOrigins.contains(QStringLiteral("*")))
{
}

bool CorsPolicy::isAllowed(const QString& origin) const
{
    if (origin.isEmpty())
        return false;
    return m_allowAny || m_allowedOrigins.contains(origin);
}

bool CorsPolicy::isPreflight(const HttpRequest& request)
{
    return request.method == QStringLiteral("OPTIONS")
        && request.hasHeader(QStringLiteral("origin"))
        && request.hasHeader(QStringLiteral("access-control-request-method"));
}

HttpResponse CorsPolicy::preflight(const HttpRequest& request) const
{
    const QString origin = request.header(QStringLiteral("origin"));
    if (!isAllowed(origin)) {
        HttpResponse denied = HttpResponse::text(400, "Disallowed CORS origin");
        denied.setHeader(QStringLiteral("Vary"), QStringLiteral("Origin"));
        return denied;
    }

    HttpResponse response = HttpResponse::text(200, "OK");
    response.setHeader(QStringLiteral("Access-Control-Allow-Origin"), origin);
    response.setHeader(QStringLiteral("Access-Control-Allow-Credentials"), QStringLiteral("true"));
    response.setHeader(QStringLiteral("Access-Control-Allow-Methods"), kAllowedMethods);
    response.setHeader(QStringLiteral("Access-Control-Max-Age"), kMaxAge);
    const QString requestedHeaders = request.header(QStringLiteral("access-control-request-headers"));
    if (!requestedHeaders.isEmpty())
        response.setHeader(QStringLiteral("Access-Control-Allow-Headers"), requestedHeaders);
    response.setHeader(QStringLiteral("Vary"), QStringLiteral("Origin"));
    return response;
}

void CorsPolicy::decorate(const HttpRequest& request, HttpResponse& response) const
{
    const QString origin = request.header(QStringLiteral("origin"));
    if (!isAllowed(origin))
        return;

    response.setHeader(QStringLiteral("Access-Control-Allow-Origin"), origin);
    response.setHeader(QStringLiteral("Access-Control-Allow-Credentials"), QStringLiteral("true"));
    response.setHeader(QStringLiteral("Vary"), QStringLiteral("Origin"));
}
