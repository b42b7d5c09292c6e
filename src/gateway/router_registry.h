#pragma once
#include "adapters/source_adapter.h"
#include <QJsonObject>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

struct RouteMatch {
    const ISourceAdapter* adapter = nullptr;
    Endpoint endpoint;
    QMap<QString, QString> pathParams;
};

struct RouteLookup {
    std::optional<RouteMatch> match;
    // True when some route matches the path under another method.
    bool pathKnown = false;
};

// Mounts every source adapter under its own prefix and resolves inbound
// paths to endpoints. prefixes() keeps registration order.
class RouterRegistry {
public:
    RouterRegistry() = default;
    RouterRegistry(const RouterRegistry&) = delete;
    RouterRegistry& operator=(const RouterRegistry&) = delete;

    VoidResult registerAdapter(std::unique_ptr<ISourceAdapter> adapter);

    RouteLookup match(const QString& method, const QString& path) const;

    // prefix -> {"example_endpoint", "description"} for every mounted source.
    QJsonObject features() const;
    QStringList prefixes() const;
    int routeCount() const;

    static bool isReservedPrefix(const QString& prefix);
    // Splits a request path into percent-decoded segments.
    static QStringList splitPath(const QString& path);

private:
    struct CompiledRoute {
        QStringList segments;
        int literalCount = 0;
        Endpoint endpoint;
    };

    struct Mount {
        std::unique_ptr<ISourceAdapter> adapter;
        QList<CompiledRoute> routes;
    };

    std::vector<Mount> m_mounts;

    const Mount* findMount(const QString& prefix) const;
    static std::optional<QMap<QString, QString>> matchSegments(const CompiledRoute& route,
                                                               const QStringList& segments);
};
