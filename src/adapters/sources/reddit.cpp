#include "reddit.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://www.reddit.com");
const QString kUserAgent = QStringLiteral("devgate/1.0.0 (developer platform aggregation gateway)");
constexpr qsizetype kSearchLimit = 25;
constexpr qsizetype kTopLimit = 10;

}

RedditSource::RedditSource(IUpstreamClient& client)
    : SourceAdapter(client)
{
}

QString RedditSource::exampleEndpoint() const
{
    return QStringLiteral("/reddit/top/programming");
}

QString RedditSource::description() const
{
    return QStringLiteral("Search posts within a subreddit or fetch today's top posts.");
}

QList<Endpoint> RedditSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/r/{subreddit}/search"),
         QStringLiteral("Search posts of a subreddit"),
         [this](const EndpointRequest& r, EndpointReply reply) { search(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/top/{subreddit}"),
         QStringLiteral("Today's top posts of a subreddit"),
         [this](const EndpointRequest& r, EndpointReply reply) { top(r, std::move(reply)); }},
    };
}

UpstreamRequest RedditSource::listingRequest(const QUrl& url)
{
    UpstreamRequest request;
    request.url = url;
    request.headers[QStringLiteral("User-Agent")] = kUserAgent;
    return request;
}

Result<QList<Post>> RedditSource::shapeListing(const QJsonObject& listing, const QString& subreddit,
                                               qsizetype cap) const
{
    const QJsonArray children = listing.value(QStringLiteral("data")).toObject()
                                    .value(QStringLiteral("children")).toArray();
    return json_fields::mapObjects<Post>(children, [&subreddit](const QJsonObject& child) {
        return Post::fromReddit(child.value(QStringLiteral("data")).toObject(), subreddit);
    }, cap);
}

void RedditSource::search(const EndpointRequest& request, EndpointReply reply) const
{
    const QString subreddit = request.pathParam(QStringLiteral("subreddit"));
    auto query = requireQuery(request, QStringLiteral("query"));
    if (!query) {
        reply(std::unexpected(query.error()));
        return;
    }

    const UpstreamRequest upstream = listingRequest(
        makeUrl(kBaseUrl, QStringLiteral("/r/%1/search.json").arg(segment(subreddit)),
                {{QStringLiteral("q"), *query},
                 {QStringLiteral("restrict_sr"), QStringLiteral("on")},
                 {QStringLiteral("limit"), QString::number(kSearchLimit)}}));

    fetchObject(upstream, {QStringLiteral("Error searching Reddit"), {}},
                thenReply<QJsonObject>(std::move(reply), [this, subreddit](const QJsonObject& listing) -> Result<QJsonValue> {
                    auto posts = shapeListing(listing, subreddit, kSearchLimit);
                    if (!posts)
                        return std::unexpected(posts.error());
                    return toJsonList(*posts);
                }));
}

void RedditSource::top(const EndpointRequest& request, EndpointReply reply) const
{
    const QString subreddit = request.pathParam(QStringLiteral("subreddit"));

    const UpstreamRequest upstream = listingRequest(
        makeUrl(kBaseUrl, QStringLiteral("/r/%1/top.json").arg(segment(subreddit)),
                {{QStringLiteral("t"), QStringLiteral("day")},
                 {QStringLiteral("limit"), QString::number(kTopLimit)}}));

    fetchObject(upstream,
                {QStringLiteral("Error fetching top posts"),
                 QStringLiteral("Subreddit '%1' not found.").arg(subreddit)},
                thenReply<QJsonObject>(std::move(reply), [this, subreddit](const QJsonObject& listing) -> Result<QJsonValue> {
                    auto posts = shapeListing(listing, subreddit, kTopLimit);
                    if (!posts)
                        return std::unexpected(posts.error());
                    return toJsonList(*posts);
                }));
}
