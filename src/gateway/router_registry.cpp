#include "router_registry.h"
#include "core/log_manager.h"
#include <QSet>

namespace {

bool isParamSegment(const QString& segment)
{
    return segment.size() > 2 && segment.startsWith(QLatin1Char('{')) && segment.endsWith(QLatin1Char('}'));
}

QString paramName(const QString& segment)
{
    return segment.mid(1, segment.size() - 2);
}

DomainFailure rejected(const QString& prefix, const QString& reason)
{
    LOG_WARNING(QStringLiteral("RouterRegistry: rejected adapter '%1': %2").arg(prefix, reason));
    return DomainFailure::internal(QStringLiteral("Cannot register '%1': %2").arg(prefix, reason));
}

}

bool RouterRegistry::isReservedPrefix(const QString& prefix)
{
    return prefix.isEmpty() || prefix == QStringLiteral("features");
}

QStringList RouterRegistry::splitPath(const QString& path)
{
    QStringList segments = path.split(QLatin1Char('/'));
    if (!segments.isEmpty() && segments.first().isEmpty())
        segments.removeFirst();
    // A single trailing slash addresses the same resource.
    if (segments.size() > 1 && segments.last().isEmpty())
        segments.removeLast();

    for (QString& segment : segments)
        segment = QUrl::fromPercentEncoding(segment.toUtf8());
    return segments;
}

VoidResult RouterRegistry::registerAdapter(std::unique_ptr<ISourceAdapter> adapter)
{
    if (!adapter)
        return std::unexpected(DomainFailure::internal(QStringLiteral("Cannot register a null adapter")));

    const QString prefix = adapter->prefix();
    if (isReservedPrefix(prefix) || prefix.contains(QLatin1Char('/')))
        return std::unexpected(rejected(prefix, QStringLiteral("prefix is reserved")));
    if (findMount(prefix))
        return std::unexpected(rejected(prefix, QStringLiteral("prefix is already bound")));

    Mount mount;
    QSet<QString> seen;
    for (const Endpoint& endpoint : adapter->endpoints()) {
        const QString method = endpoint.method.trimmed().toUpper();
        if (!endpoint.pattern.startsWith(QLatin1Char('/')) || !endpoint.handler)
            return std::unexpected(rejected(prefix, QStringLiteral("invalid endpoint '%1'").arg(endpoint.pattern)));

        CompiledRoute route;
        route.segments = endpoint.pattern.mid(1).split(QLatin1Char('/'));
        QStringList shape;
        for (const QString& segment : route.segments) {
            if (segment.isEmpty())
                return std::unexpected(rejected(prefix, QStringLiteral("empty segment in '%1'").arg(endpoint.pattern)));
            if (isParamSegment(segment)) {
                shape.append(QStringLiteral("{}"));
            } else {
                shape.append(segment);
                ++route.literalCount;
            }
        }

        // Routes differing only in parameter names would be ambiguous.
        const QString key = method + QLatin1Char(' ') + shape.join(QLatin1Char('/'));
        if (seen.contains(key)) {
            return std::unexpected(rejected(prefix, QStringLiteral("duplicate route %1 %2")
                                                        .arg(method, endpoint.pattern)));
        }
        seen.insert(key);

        route.endpoint = endpoint;
        route.endpoint.method = method;
        mount.routes.append(route);
    }

    if (mount.routes.isEmpty())
        return std::unexpected(rejected(prefix, QStringLiteral("no endpoints")));

    LOG_INFO(QStringLiteral("RouterRegistry: mounted /%1 with %2 route(s)")
                 .arg(prefix)
                 .arg(mount.routes.size()));
    mount.adapter = std::move(adapter);
    m_mounts.push_back(std::move(mount));
    return {};
}

const RouterRegistry::Mount* RouterRegistry::findMount(const QString& prefix) const
{
    for (const Mount& mount : m_mounts) {
        if (mount.adapter->prefix() == prefix)
            return &mount;
    }
    return nullptr;
}

std::optional<QMap<QString, QString>> RouterRegistry::matchSegments(const CompiledRoute& route,
                                                                    const QStringList& segments)
{
    if (route.segments.size() != segments.size())
        return std::nullopt;

    QMap<QString, QString> params;
    for (qsizetype i = 0; i < segments.size(); ++i) {
        const QString& pattern = route.segments.at(i);
        const QString& actual = segments.at(i);
        if (isParamSegment(pattern)) {
            if (actual.isEmpty())
                return std::nullopt;
            params.insert(paramName(pattern), actual);
        } else if (pattern != actual) {
            return std::nullopt;
        }
    }
    return params;
}

RouteLookup RouterRegistry::match(const QString& method, const QString& path) const
{
    RouteLookup lookup;
    QStringList segments = splitPath(path);
    if (segments.isEmpty())
        return lookup;

    const Mount* mount = findMount(segments.takeFirst());
    if (!mount || segments.isEmpty())
        return lookup;

    const QString normalizedMethod = method.trimmed().toUpper();
    const CompiledRoute* best = nullptr;
    QMap<QString, QString> bestParams;
    for (const CompiledRoute& route : mount->routes) {
        auto params = matchSegments(route, segments);
        if (!params)
            continue;
        lookup.pathKnown = true;
        if (route.endpoint.method != normalizedMethod)
            continue;
        if (!best || route.literalCount > best->literalCount) {
            best = &route;
            bestParams = *params;
        }
    }

    if (best)
        lookup.match = RouteMatch{mount->adapter.get(), best->endpoint, bestParams};
    return lookup;
}

QJsonObject RouterRegistry::features() const
{
    QJsonObject listing;
    for (const Mount& mount : m_mounts) {
        QJsonObject entry;
        entry[QStringLiteral("example_endpoint")] = mount.adapter->exampleEndpoint();
        entry[QStringLiteral("description")] = mount.adapter->description();
        listing[mount.adapter->prefix()] = entry;
    }
    return listing;
}

QStringList RouterRegistry::prefixes() const
{
    QStringList result;
    for (const Mount& mount : m_mounts)
        result.append(mount.adapter->prefix());
    return result;
}

int RouterRegistry::routeCount() const
{
    int count = 0;
    for (const Mount& mount : m_mounts)
        count += static_cast<int>(mount.routes.size());
    return count;
}
