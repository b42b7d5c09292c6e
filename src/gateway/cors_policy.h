#pragma once
#include "http_types.h"
#include <QStringList>

// Cross-origin handling for browser clients: allowed origins are echoed back
// with credentials permitted; "*" in the allow-list admits any origin.
class CorsPolicy {
public:
    explicit CorsPolicy(const QStringList& allowedOrigins);

    bool isAllowed(const QString& origin) const;
    static bool isPreflight(const HttpRequest& request);

    HttpResponse preflight(const HttpRequest& request) const;
    void decorate(const HttpRequest& request, HttpResponse& response) const;

    const QStringList& allowedOrigins() const { return m_allowedOrigins; }

private:
    QStringList m_allowedOrigins;
    bool m_allowAny = false;
};
