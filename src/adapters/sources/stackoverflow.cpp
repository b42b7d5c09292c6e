#include "stackoverflow.h"
#include "model/questions.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://api.stackexchange.com/2.3");
const QString kSite = QStringLiteral("stackoverflow");
constexpr qsizetype kFeaturedLimit = 15;
constexpr qsizetype kUserListLimit = 10;

}

StackOverflowSource::StackOverflowSource(IUpstreamClient& client, const DefaultIdentities& defaults)
    : SourceAdapter(client)
    , m_defaultUserId(defaults.stackOverflowUserId)
    , m_defaultUsername(defaults.stackOverflowUsername)
{
}

QString StackOverflowSource::exampleEndpoint() const
{
    return QStringLiteral("/stackoverflow/featured");
}

QString StackOverflowSource::description() const
{
    return QStringLiteral("Fetch featured questions, a user's questions and answers, or search Stack Overflow by title and tags.");
}

QList<Endpoint> StackOverflowSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/featured"),
         QStringLiteral("Questions with an active bounty"),
         [this](const EndpointRequest& r, EndpointReply reply) { featured(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/questions"),
         QStringLiteral("Most recent questions of a user"),
         [this](const EndpointRequest& r, EndpointReply reply) { questions(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/answers"),
         QStringLiteral("Most recent answers of a user"),
         [this](const EndpointRequest& r, EndpointReply reply) { answers(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/search"),
         QStringLiteral("Questions by title and tags"),
         [this](const EndpointRequest& r, EndpointReply reply) { search(r, std::move(reply)); }},
    };
}

void StackOverflowSource::fetchItems(const QString& path,
                                     const QList<std::pair<QString, QString>>& query,
                                     const QString& context,
                                     Continuation<QJsonArray> next) const
{
    QList<std::pair<QString, QString>> params = query;
    params.append({QStringLiteral("site"), kSite});

    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, path, params);

    fetchObject(request, {context, {}}, [next = std::move(next)](Result<QJsonObject> envelope) {
        if (!envelope) {
            next(std::unexpected(envelope.error()));
            return;
        }
        next(envelope->value(QStringLiteral("items")).toArray());
    });
}

void StackOverflowSource::lookupUserId(const QString& username, Continuation<qint64> next) const
{
    fetchItems(QStringLiteral("/users"),
               {{QStringLiteral("order"), QStringLiteral("desc")},
                {QStringLiteral("sort"), QStringLiteral("reputation")},
                {QStringLiteral("inname"), username}},
               QStringLiteral("Failed to fetch user ID"),
               [username, next = std::move(next)](Result<QJsonArray> items) {
        if (!items) {
            next(std::unexpected(items.error()));
            return;
        }
        if (items->isEmpty()) {
            next(std::unexpected(DomainFailure::notFound(
                QStringLiteral("Stack Overflow user '%1' not found.").arg(username))));
            return;
        }
        next(json_fields::requireInt(items->first().toObject(), QStringLiteral("user_id"),
                                     QStringLiteral("Stack Exchange user")));
    });
}

void StackOverflowSource::resolveUserId(const EndpointRequest& request, Continuation<qint64> next) const
{
    auto explicitId = optionalIntQuery(request, QStringLiteral("user_id"));
    if (!explicitId) {
        next(std::unexpected(explicitId.error()));
        return;
    }
    if (*explicitId && **explicitId > 0) {
        next(**explicitId);
        return;
    }

    if (m_defaultUserId) {
        next(*m_defaultUserId);
        return;
    }

    const QString username = request.queryValue(QStringLiteral("username")).value_or(QString());
    if (!username.isEmpty()) {
        lookupUserId(username, std::move(next));
        return;
    }

    if (!m_defaultUsername.isEmpty()) {
        lookupUserId(m_defaultUsername, std::move(next));
        return;
    }

    next(std::unexpected(DomainFailure::badRequest(
        QStringLiteral("A Stack Overflow user_id or username must be provided."))));
}

void StackOverflowSource::featured(const EndpointRequest&, EndpointReply reply) const
{
    fetchItems(QStringLiteral("/questions/featured"),
               {{QStringLiteral("order"), QStringLiteral("desc")},
                {QStringLiteral("sort"), QStringLiteral("activity")}},
               QStringLiteral("Failed to fetch featured questions"),
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& items) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<FeaturedQuestion>(
                       items, &FeaturedQuestion::fromStackExchange, kFeaturedLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void StackOverflowSource::questions(const EndpointRequest& request, EndpointReply reply) const
{
    resolveUserId(request, [this, reply](Result<qint64> userId) {
        if (!userId) {
            reply(std::unexpected(userId.error()));
            return;
        }
        fetchItems(QStringLiteral("/users/%1/questions").arg(*userId),
                   {{QStringLiteral("order"), QStringLiteral("desc")},
                    {QStringLiteral("sort"), QStringLiteral("creation")}},
                   QStringLiteral("Failed to fetch questions"),
                   thenReply<QJsonArray>(reply, [](const QJsonArray& items) -> Result<QJsonValue> {
                       auto records = json_fields::mapObjects<Question>(items, &Question::fromStackExchange,
                                                                        kUserListLimit);
                       if (!records)
                           return std::unexpected(records.error());
                       return toJsonList(*records);
                   }));
    });
}

void StackOverflowSource::answers(const EndpointRequest& request, EndpointReply reply) const
{
    resolveUserId(request, [this, reply](Result<qint64> userId) {
        if (!userId) {
            reply(std::unexpected(userId.error()));
            return;
        }
        fetchItems(QStringLiteral("/users/%1/answers").arg(*userId),
                   {{QStringLiteral("order"), QStringLiteral("desc")},
                    {QStringLiteral("sort"), QStringLiteral("creation")}},
                   QStringLiteral("Failed to fetch answers"),
                   thenReply<QJsonArray>(reply, [](const QJsonArray& items) -> Result<QJsonValue> {
                       auto records = json_fields::mapObjects<Answer>(items, &Answer::fromStackExchange,
                                                                      kUserListLimit);
                       if (!records)
                           return std::unexpected(records.error());
                       return toJsonList(*records);
                   }));
    });
}

void StackOverflowSource::search(const EndpointRequest& request, EndpointReply reply) const
{
    auto query = requireQuery(request, QStringLiteral("q"));
    if (!query) {
        reply(std::unexpected(query.error()));
        return;
    }
    auto tagged = requireQuery(request, QStringLiteral("tagged"));
    if (!tagged) {
        reply(std::unexpected(tagged.error()));
        return;
    }

    fetchItems(QStringLiteral("/search"),
               {{QStringLiteral("intitle"), *query},
                {QStringLiteral("tagged"), *tagged},
                {QStringLiteral("sort"), QStringLiteral("relevance")},
                {QStringLiteral("order"), QStringLiteral("desc")}},
               QStringLiteral("Error searching Stack Overflow"),
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& items) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Question>(items, &Question::fromStackExchangeSearch);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}
