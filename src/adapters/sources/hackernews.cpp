#include "hackernews.h"

namespace {

const QString kFirebaseBase = QStringLiteral("https://hacker-news.firebaseio.com/v0");
const QString kAlgoliaBase = QStringLiteral("https://hn.algolia.com/api/v1");
constexpr qsizetype kFeedLimit = 10;

// The Firebase API answers 200 with a literal null for unknown ids.
bool isNullBody(const QByteArray& body)
{
    return body.trimmed() == "null" || body.trimmed().isEmpty();
}

UpstreamRequest plainRequest(const QUrl& url)
{
    UpstreamRequest request;
    request.url = url;
    return request;
}

}

HackerNewsSource::HackerNewsSource(IUpstreamClient& client)
    : SourceAdapter(client)
{
}

QString HackerNewsSource::exampleEndpoint() const
{
    return QStringLiteral("/hackernews/topstories");
}

QString HackerNewsSource::description() const
{
    return QStringLiteral("Fetch top, new and best stories, items and users from Hacker News, or search stories.");
}

QList<Endpoint> HackerNewsSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/topstories"),
         QStringLiteral("Top 10 stories"),
         [this](const EndpointRequest&, EndpointReply reply) { stories(QStringLiteral("top"), std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/newstories"),
         QStringLiteral("10 newest stories"),
         [this](const EndpointRequest&, EndpointReply reply) { stories(QStringLiteral("new"), std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/beststories"),
         QStringLiteral("10 best stories"),
         [this](const EndpointRequest&, EndpointReply reply) { stories(QStringLiteral("best"), std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/item/{item_id}"),
         QStringLiteral("Single item by id"),
         [this](const EndpointRequest& r, EndpointReply reply) { item(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/user/{user_id}"),
         QStringLiteral("User profile"),
         [this](const EndpointRequest& r, EndpointReply reply) { user(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/search"),
         QStringLiteral("Story search"),
         [this](const EndpointRequest& r, EndpointReply reply) { search(r, std::move(reply)); }},
    };
}

void HackerNewsSource::stories(const QString& feed, EndpointReply reply) const
{
    const UpstreamRequest feedRequest =
        plainRequest(makeUrl(kFirebaseBase, QStringLiteral("/%1stories.json").arg(feed)));
    fetchArray(feedRequest, {QStringLiteral("Failed to fetch %1 stories").arg(feed), {}},
               [this, reply](Result<QJsonArray> ids) {
        if (!ids) {
            reply(std::unexpected(ids.error()));
            return;
        }
        fanOut().run<Story>(storyTasks(*ids), [reply](QList<Story> stories) {
            reply(toJsonList(stories));
        });
    });
}

QList<FanOutTask<Story>> HackerNewsSource::storyTasks(const QJsonArray& ids) const
{
    QList<FanOutTask<Story>> tasks;
    for (const QJsonValue& id : ids) {
        if (tasks.size() >= kFeedLimit)
            break;
        if (!id.isDouble())
            continue;

        const UpstreamRequest itemRequest = plainRequest(
            makeUrl(kFirebaseBase, QStringLiteral("/item/%1.json").arg(id.toInteger())));
        tasks.append(FanOutTask<Story>{itemRequest, [this](const UpstreamResponse& response) -> Result<QList<Story>> {
            // Deleted ids, jobs and untitled items contribute nothing.
            QList<Story> shaped;
            if (isNullBody(response.body))
                return shaped;
            auto doc = json_fields::parseDocument(response.body, displayName());
            if (!doc)
                return std::unexpected(doc.error());

            const auto story = Story::fromHackerNewsItem(doc->object());
            if (story && story->type == QStringLiteral("story"))
                shaped.append(*story);
            return shaped;
        }});
    }
    return tasks;
}

void HackerNewsSource::item(const EndpointRequest& request, EndpointReply reply) const
{
    auto itemId = intPathParam(request, QStringLiteral("item_id"));
    if (!itemId) {
        reply(std::unexpected(itemId.error()));
        return;
    }

    const QString notFound = QStringLiteral("Item with ID %1 not found.").arg(*itemId);
    fetch(plainRequest(makeUrl(kFirebaseBase, QStringLiteral("/item/%1.json").arg(*itemId))),
          {QStringLiteral("Failed to fetch item"), notFound},
          thenReply<UpstreamResponse>(std::move(reply), [this, notFound](const UpstreamResponse& response) -> Result<QJsonValue> {
              if (isNullBody(response.body))
                  return std::unexpected(DomainFailure::notFound(notFound));

              auto doc = json_fields::parseDocument(response.body, displayName());
              if (!doc)
                  return std::unexpected(doc.error());
              auto obj = requireObject(*doc);
              if (!obj)
                  return std::unexpected(obj.error());

              auto story = Story::fromHackerNewsItemDetail(*obj);
              if (!story)
                  return std::unexpected(story.error());
              return QJsonValue(story->toJson());
          }));
}

void HackerNewsSource::user(const EndpointRequest& request, EndpointReply reply) const
{
    const QString userId = request.pathParam(QStringLiteral("user_id"));
    const QString notFound = QStringLiteral("User '%1' not found.").arg(userId);

    fetch(plainRequest(makeUrl(kFirebaseBase, QStringLiteral("/user/%1.json").arg(segment(userId)))),
          {QStringLiteral("Failed to fetch user"), notFound},
          thenReply<UpstreamResponse>(std::move(reply), [this, notFound](const UpstreamResponse& response) -> Result<QJsonValue> {
              if (isNullBody(response.body))
                  return std::unexpected(DomainFailure::notFound(notFound));

              auto doc = json_fields::parseDocument(response.body, displayName());
              if (!doc)
                  return std::unexpected(doc.error());
              auto obj = requireObject(*doc);
              if (!obj)
                  return std::unexpected(obj.error());

              auto record = HackerNewsUser::fromHackerNews(*obj);
              if (!record)
                  return std::unexpected(record.error());
              return QJsonValue(record->toJson());
          }));
}

void HackerNewsSource::search(const EndpointRequest& request, EndpointReply reply) const
{
    auto query = requireQuery(request, QStringLiteral("query"));
    if (!query) {
        reply(std::unexpected(query.error()));
        return;
    }

    fetchObject(plainRequest(makeUrl(kAlgoliaBase, QStringLiteral("/search"),
                                     {{QStringLiteral("query"), *query},
                                      {QStringLiteral("tags"), QStringLiteral("story")}})),
                {QStringLiteral("Error searching Hacker News"), {}},
                thenReply<QJsonObject>(std::move(reply), [](const QJsonObject& result) -> Result<QJsonValue> {
                    QList<Story> records;
                    for (const QJsonValue& hit : result.value(QStringLiteral("hits")).toArray()) {
                        const auto story = Story::fromAlgoliaHit(hit.toObject());
                        if (story)
                            records.append(*story);
                    }
                    return toJsonList(records);
                }));
}
