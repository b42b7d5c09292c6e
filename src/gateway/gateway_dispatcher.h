#pragma once
#include "cors_policy.h"
#include "http_types.h"
#include "router_registry.h"
#include <functional>

using ResponseReady = std::function<void(HttpResponse)>;

// Turns one parsed inbound request into a response: CORS preflight, the root
// and discovery endpoints, then the mounted sources. Failures are rendered as
// {"detail": message}. done runs once the response is complete; for requests
// that need no upstream call that is before handle() returns.
class GatewayDispatcher {
public:
    GatewayDispatcher(const RouterRegistry& registry, const CorsPolicy& cors);

    void handle(const HttpRequest& request, ResponseReady done) const;

    static HttpResponse failureResponse(const DomainFailure& failure);
    static QJsonObject welcomeMessage();

private:
    const RouterRegistry& m_registry;
    CorsPolicy m_cors;

    void route(const HttpRequest& request, ResponseReady done) const;
};
