#include "codeforces.h"
#include "model/competitive.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://codeforces.com/api");
const QString kUpcomingPhase = QStringLiteral("BEFORE");
constexpr qsizetype kContestLimit = 10;

}

CodeforcesSource::CodeforcesSource(IUpstreamClient& client, const DefaultIdentities& defaults)
    : SourceAdapter(client)
    , m_defaultHandle(defaults.codeforcesHandle)
{
}

QString CodeforcesSource::exampleEndpoint() const
{
    return QStringLiteral("/codeforces/contests");
}

QString CodeforcesSource::description() const
{
    return QStringLiteral("Fetch upcoming Codeforces contests and user profiles.");
}

QList<Endpoint> CodeforcesSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/contests"),
         QStringLiteral("Upcoming contests"),
         [this](const EndpointRequest& r, EndpointReply reply) { contests(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/userinfo/me"),
         QStringLiteral("Profile of the configured handle"),
         [this](const EndpointRequest& r, EndpointReply reply) { myProfile(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/userinfo/{handle}"),
         QStringLiteral("Profile of a handle"),
         [this](const EndpointRequest& r, EndpointReply reply) { profile(r, std::move(reply)); }},
    };
}

void CodeforcesSource::contests(const EndpointRequest&, EndpointReply reply) const
{
    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, QStringLiteral("/contest.list"));

    fetchObject(request, {QStringLiteral("Failed to fetch contests"), {}},
                thenReply<QJsonObject>(std::move(reply), [this](const QJsonObject& envelope) -> Result<QJsonValue> {
                    auto result = requireArrayField(envelope, QStringLiteral("result"));
                    if (!result)
                        return std::unexpected(result.error());

                    // Filter first, cap second.
                    QList<Contest> upcoming;
                    for (const QJsonValue& value : *result) {
                        if (upcoming.size() >= kContestLimit)
                            break;
                        const QJsonObject obj = value.toObject();
                        if (json_fields::stringOr(obj, QStringLiteral("phase"), QString()) != kUpcomingPhase)
                            continue;
                        auto contest = Contest::fromCodeforces(obj);
                        if (!contest)
                            return std::unexpected(contest.error());
                        upcoming.append(*contest);
                    }
                    return toJsonList(upcoming);
                }));
}

void CodeforcesSource::myProfile(const EndpointRequest&, EndpointReply reply) const
{
    if (m_defaultHandle.isEmpty()) {
        reply(std::unexpected(DomainFailure::configuration(config_keys::kCodeforcesHandle)));
        return;
    }
    fetchProfile(m_defaultHandle, std::move(reply));
}

void CodeforcesSource::profile(const EndpointRequest& request, EndpointReply reply) const
{
    fetchProfile(request.pathParam(QStringLiteral("handle")), std::move(reply));
}

void CodeforcesSource::fetchProfile(const QString& handle, EndpointReply reply) const
{
    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, QStringLiteral("/user.info"), {{QStringLiteral("handles"), handle}});

    client().execute(request, [this, handle, reply = std::move(reply)](Result<UpstreamResponse> response) {
        reply(shapeProfile(handle, response));
    });
}

Result<QJsonValue> CodeforcesSource::shapeProfile(const QString& handle,
                                                  const Result<UpstreamResponse>& response) const
{
    const QString notFound = QStringLiteral("Codeforces user '%1' not found.").arg(handle);

    // Codeforces answers 400 for unknown handles, so both 400 and 404 mean "no such user".
    if (!response)
        return std::unexpected(upstream_errors::transportFailure(displayName(), response.error()));
    if (response->statusCode == 400 || response->statusCode == 404)
        return std::unexpected(DomainFailure::notFound(notFound));
    if (!response->isSuccess()) {
        return std::unexpected(upstream_errors::statusFailure(
            *response, {QStringLiteral("Failed to fetch Codeforces user"), notFound}));
    }

    auto doc = json_fields::parseDocument(response->body, displayName());
    if (!doc)
        return std::unexpected(doc.error());
    auto envelope = requireObject(*doc);
    if (!envelope)
        return std::unexpected(envelope.error());

    const QJsonArray result = envelope->value(QStringLiteral("result")).toArray();
    if (result.isEmpty())
        return std::unexpected(DomainFailure::notFound(notFound));

    auto record = UserProfile::fromCodeforces(result.first().toObject());
    if (!record)
        return std::unexpected(record.error());
    return QJsonValue(record->toJson());
}
