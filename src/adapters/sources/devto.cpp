#include "devto.h"
#include "model/news.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://dev.to/api");
constexpr qsizetype kListLimit = 10;

}

DevToSource::DevToSource(IUpstreamClient& client, const SourceCredentials& credentials)
    : SourceAdapter(client)
    , m_apiKey(credentials.devtoApiKey)
{
}

QString DevToSource::exampleEndpoint() const
{
    return QStringLiteral("/devto/articles");
}

QString DevToSource::description() const
{
    return QStringLiteral("Fetch the latest DEV.to articles or a single article by id.");
}

QList<Endpoint> DevToSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/articles"),
         QStringLiteral("Latest articles"),
         [this](const EndpointRequest& r, EndpointReply reply) { articles(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/article/{article_id}"),
         QStringLiteral("Single article by id"),
         [this](const EndpointRequest& r, EndpointReply reply) { article(r, std::move(reply)); }},
    };
}

Result<UpstreamRequest> DevToSource::authorizedRequest(const QUrl& url) const
{
    if (m_apiKey.isEmpty())
        return std::unexpected(DomainFailure::configuration(config_keys::kDevtoApiKey));

    UpstreamRequest request;
    request.url = url;
    request.headers[QStringLiteral("api-key")] = m_apiKey;
    request.headers[QStringLiteral("Accept")] = QStringLiteral("application/vnd.forem.api-v1+json");
    return request;
}

void DevToSource::articles(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(makeUrl(kBaseUrl, QStringLiteral("/articles/latest"),
                                             {{QStringLiteral("per_page"), QString::number(kListLimit)}}));
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Error fetching articles"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Article>(array, &Article::fromDevTo, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void DevToSource::article(const EndpointRequest& request, EndpointReply reply) const
{
    auto articleId = intPathParam(request, QStringLiteral("article_id"));
    if (!articleId) {
        reply(std::unexpected(articleId.error()));
        return;
    }

    auto upstream = authorizedRequest(makeUrl(kBaseUrl, QStringLiteral("/articles/%1").arg(*articleId)));
    if (!upstream) {
        reply(std::unexpected(upstream.error()));
        return;
    }

    fetchObject(*upstream,
                {QStringLiteral("Error fetching article"),
                 QStringLiteral("Article with ID %1 not found.").arg(*articleId)},
                thenReply<QJsonObject>(std::move(reply), [](const QJsonObject& obj) -> Result<QJsonValue> {
                    auto record = Article::fromDevTo(obj);
                    if (!record)
                        return std::unexpected(record.error());
                    return QJsonValue(record->toJson());
                }));
}
