#include "source_adapter.h"

std::optional<QString> EndpointRequest::queryValue(const QString& name) const
{
    if (!query.hasQueryItem(name))
        return std::nullopt;
    return query.queryItemValue(name, QUrl::FullyDecoded);
}

SourceAdapter::SourceAdapter(IUpstreamClient& client)
    : m_client(client)
{
}

void SourceAdapter::fetch(const UpstreamRequest& request, const StatusMessages& messages,
                          Continuation<UpstreamResponse> next) const
{
    m_client.execute(request, [this, messages, next = std::move(next)](Result<UpstreamResponse> result) {
        next(upstream_errors::checked(result, displayName(), messages));
    });
}

void SourceAdapter::fetchJson(const UpstreamRequest& request, const StatusMessages& messages,
                              Continuation<QJsonDocument> next) const
{
    fetch(request, messages, [this, next = std::move(next)](Result<UpstreamResponse> response) {
        if (!response) {
            next(std::unexpected(response.error()));
            return;
        }
        next(json_fields::parseDocument(response->body, displayName()));
    });
}

void SourceAdapter::fetchArray(const UpstreamRequest& request, const StatusMessages& messages,
                               Continuation<QJsonArray> next) const
{
    fetchJson(request, messages, [this, next = std::move(next)](Result<QJsonDocument> doc) {
        if (!doc) {
            next(std::unexpected(doc.error()));
            return;
        }
        next(requireArray(*doc));
    });
}

void SourceAdapter::fetchObject(const UpstreamRequest& request, const StatusMessages& messages,
                                Continuation<QJsonObject> next) const
{
    fetchJson(request, messages, [this, next = std::move(next)](Result<QJsonDocument> doc) {
        if (!doc) {
            next(std::unexpected(doc.error()));
            return;
        }
        next(requireObject(*doc));
    });
}

Result<QJsonArray> SourceAdapter::requireArray(const QJsonDocument& doc) const
{
    if (!doc.isArray()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("Unexpected %1 payload: expected a JSON array.").arg(displayName())));
    }
    return doc.array();
}

Result<QJsonObject> SourceAdapter::requireObject(const QJsonDocument& doc) const
{
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("Unexpected %1 payload: expected a JSON object.").arg(displayName())));
    }
    return doc.object();
}

Result<QJsonArray> SourceAdapter::requireArrayField(const QJsonObject& obj, const QString& key) const
{
    const QJsonValue value = obj.value(key);
    if (!value.isArray())
        return std::unexpected(json_fields::missingField(displayName(), key));
    return value.toArray();
}

Result<QString> SourceAdapter::requireQuery(const EndpointRequest& request,
                                            const QString& name,
                                            int minLength)
{
    const auto value = request.queryValue(name);
    if (!value) {
        return std::unexpected(DomainFailure::badRequest(
            QStringLiteral("Query parameter '%1' is required.").arg(name)));
    }
    if (value->size() < minLength) {
        return std::unexpected(DomainFailure::badRequest(
            QStringLiteral("Query parameter '%1' must be at least %2 character(s) long.")
                .arg(name)
                .arg(minLength)));
    }
    return *value;
}

Result<qint64> SourceAdapter::intPathParam(const EndpointRequest& request, const QString& name)
{
    bool ok = false;
    const qint64 value = request.pathParam(name).toLongLong(&ok);
    if (!ok) {
        return std::unexpected(DomainFailure::badRequest(
            QStringLiteral("Path parameter '%1' must be an integer.").arg(name)));
    }
    return value;
}

Result<std::optional<qint64>> SourceAdapter::optionalIntQuery(const EndpointRequest& request,
                                                              const QString& name)
{
    const auto raw = request.queryValue(name);
    if (!raw || raw->isEmpty())
        return std::optional<qint64>();

    bool ok = false;
    const qint64 value = raw->toLongLong(&ok);
    if (!ok) {
        return std::unexpected(DomainFailure::badRequest(
            QStringLiteral("Query parameter '%1' must be an integer.").arg(name)));
    }
    return std::optional<qint64>(value);
}

QString SourceAdapter::segment(const QString& raw)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(raw));
}

QUrl SourceAdapter::makeUrl(const QString& base,
                            const QString& encodedPath,
                            const QList<std::pair<QString, QString>>& query)
{
    QString url = base + encodedPath;
    if (!query.isEmpty()) {
        QStringList pairs;
        for (const auto& [key, value] : query) {
            pairs.append(QString::fromLatin1(QUrl::toPercentEncoding(key)) + QLatin1Char('=')
                         + QString::fromLatin1(QUrl::toPercentEncoding(value)));
        }
        url += QLatin1Char('?') + pairs.join(QLatin1Char('&'));
    }
    return QUrl::fromEncoded(url.toUtf8(), QUrl::StrictMode);
}
