#include "gfg.h"
#include "core/log_manager.h"
#include "model/competitive.h"
#include "upstream/html_scanner.h"

namespace {

const QString kStatsServiceUrl = QStringLiteral("https://geeks-for-geeks-stats-api.vercel.app");
const QString kPotdPageUrl = QStringLiteral("https://www.geeksforgeeks.org/problem-of-the-day");
const QString kPotdContainerClass = QStringLiteral("POTD_header-main");
const QString kBrowserUserAgent = QStringLiteral(
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36");

DomainFailure potdFailure(const QString& reason)
{
    LOG_WARNING(QStringLiteral("GeeksforGeeks: problem of the day unavailable: %1").arg(reason));
    return DomainFailure::parse(QStringLiteral("Failed to fetch or parse the GFG POTD page."));
}

}

GeeksForGeeksSource::GeeksForGeeksSource(IUpstreamClient& client)
    : SourceAdapter(client)
{
}

QString GeeksForGeeksSource::exampleEndpoint() const
{
    return QStringLiteral("/gfg/potd");
}

QString GeeksForGeeksSource::description() const
{
    return QStringLiteral("Fetch GeeksforGeeks solved-problem stats for a user and the problem of the day.");
}

QList<Endpoint> GeeksForGeeksSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/stats/{username}"),
         QStringLiteral("Solved-problem counts of a user"),
         [this](const EndpointRequest& r, EndpointReply reply) { stats(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/potd"),
         QStringLiteral("Problem of the day"),
         [this](const EndpointRequest& r, EndpointReply reply) { problemOfTheDay(r, std::move(reply)); }},
    };
}

void GeeksForGeeksSource::stats(const EndpointRequest& request, EndpointReply reply) const
{
    const QString username = request.pathParam(QStringLiteral("username"));

    UpstreamRequest upstream;
    upstream.url = makeUrl(kStatsServiceUrl, QStringLiteral("/"),
                           {{QStringLiteral("raw"), QStringLiteral("y")},
                            {QStringLiteral("userName"), username}});

    fetchObject(upstream,
                {QStringLiteral("GFG stats fetch failed for user '%1'").arg(username), {}},
                thenReply<QJsonObject>(std::move(reply), [](const QJsonObject& obj) -> Result<QJsonValue> {
                    return QJsonValue(GfgStats::fromStatsService(obj).toJson());
                }));
}

void GeeksForGeeksSource::problemOfTheDay(const EndpointRequest&, EndpointReply reply) const
{
    UpstreamRequest upstream;
    upstream.url = QUrl(kPotdPageUrl);
    upstream.headers[QStringLiteral("User-Agent")] = kBrowserUserAgent;

    client().execute(upstream, [reply = std::move(reply)](Result<UpstreamResponse> response) {
        reply(shapeProblemOfTheDay(response));
    });
}

Result<QJsonValue> GeeksForGeeksSource::shapeProblemOfTheDay(const Result<UpstreamResponse>& response)
{
    if (!response)
        return std::unexpected(potdFailure(response.error().message));
    if (!response->isSuccess())
        return std::unexpected(potdFailure(QStringLiteral("HTTP %1").arg(response->statusCode)));

    const QString html = QString::fromUtf8(response->body);
    const auto container = html_scanner::findElementByClass(html, QStringLiteral("div"), kPotdContainerClass);
    if (!container)
        return std::unexpected(potdFailure(QStringLiteral("container not found")));

    const auto anchor = html_scanner::firstAnchorWithHref(*container);
    if (!anchor)
        return std::unexpected(potdFailure(QStringLiteral("no link in container")));

    const QUrl pageUrl = response->url.isValid() ? response->url : QUrl(kPotdPageUrl);
    ProblemOfTheDay potd;
    potd.title = anchor->text;
    potd.link = pageUrl.resolved(QUrl(anchor->href)).toString();
    return QJsonValue(potd.toJson());
}
