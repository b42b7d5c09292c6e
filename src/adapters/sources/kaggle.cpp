#include "kaggle.h"
#include "model/competitive.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://www.kaggle.com/api/v1");
constexpr qsizetype kListLimit = 10;

}

KaggleSource::KaggleSource(IUpstreamClient& client, const SourceCredentials& credentials)
    : SourceAdapter(client)
    , m_username(credentials.kaggleUsername)
    , m_key(credentials.kaggleKey)
{
}

QString KaggleSource::exampleEndpoint() const
{
    return QStringLiteral("/kaggle/datasets");
}

QString KaggleSource::description() const
{
    return QStringLiteral("Fetch recently updated Kaggle datasets and competitions.");
}

QList<Endpoint> KaggleSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/datasets"),
         QStringLiteral("Recently updated datasets"),
         [this](const EndpointRequest& r, EndpointReply reply) { datasets(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/competitions"),
         QStringLiteral("Competitions by latest deadline"),
         [this](const EndpointRequest& r, EndpointReply reply) { competitions(r, std::move(reply)); }},
    };
}

Result<UpstreamRequest> KaggleSource::authorizedRequest(const QString& path, const QString& sortBy) const
{
    if (m_username.isEmpty())
        return std::unexpected(DomainFailure::configuration(config_keys::kKaggleUsername));
    if (m_key.isEmpty())
        return std::unexpected(DomainFailure::configuration(config_keys::kKaggleKey));

    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, path,
                          {{QStringLiteral("sort_by"), sortBy},
                           {QStringLiteral("page_size"), QString::number(kListLimit)}});
    const QByteArray credentials = (m_username + QLatin1Char(':') + m_key).toUtf8().toBase64();
    request.headers[QStringLiteral("Authorization")] =
        QStringLiteral("Basic ") + QString::fromLatin1(credentials);
    return request;
}

void KaggleSource::datasets(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(QStringLiteral("/datasets/list"), QStringLiteral("updated"));
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch Kaggle datasets"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Dataset>(array, &Dataset::fromKaggle, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void KaggleSource::competitions(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(QStringLiteral("/competitions/list"), QStringLiteral("latestDeadline"));
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch Kaggle competitions"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Competition>(array, &Competition::fromKaggle, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}
