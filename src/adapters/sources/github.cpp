#include "github.h"
#include "model/code_hosting.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://api.github.com");
constexpr qsizetype kListLimit = 10;
constexpr qsizetype kReleaseLimit = 30;

}

GitHubSource::GitHubSource(IUpstreamClient& client, const SourceCredentials& credentials)
    : SourceAdapter(client)
    , m_token(credentials.githubToken)
{
}

QString GitHubSource::exampleEndpoint() const
{
    return QStringLiteral("/github/repos");
}

QString GitHubSource::description() const
{
    return QStringLiteral("Fetch your GitHub repositories, issues, pull requests and repository releases.");
}

QList<Endpoint> GitHubSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/repos"),
         QStringLiteral("Recently updated repositories of the authenticated user"),
         [this](const EndpointRequest& r, EndpointReply reply) { repos(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/issues"),
         QStringLiteral("Issues assigned to the authenticated user"),
         [this](const EndpointRequest& r, EndpointReply reply) { issues(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/pulls"),
         QStringLiteral("Open pull requests involving the authenticated user"),
         [this](const EndpointRequest& r, EndpointReply reply) { myPulls(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/repos/{owner}/{repo}/pulls"),
         QStringLiteral("Open pull requests of a repository"),
         [this](const EndpointRequest& r, EndpointReply reply) { repoPulls(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/{owner}/{repo}/releases"),
         QStringLiteral("Releases of a repository"),
         [this](const EndpointRequest& r, EndpointReply reply) { releases(r, std::move(reply)); }},
    };
}

Result<UpstreamRequest> GitHubSource::authorizedRequest(const QUrl& url) const
{
    if (m_token.isEmpty())
        return std::unexpected(DomainFailure::configuration(config_keys::kGithubToken));

    return optionalAuthRequest(url);
}

UpstreamRequest GitHubSource::optionalAuthRequest(const QUrl& url) const
{
    UpstreamRequest request;
    request.url = url;
    request.headers[QStringLiteral("Accept")] = QStringLiteral("application/vnd.github.v3+json");
    if (!m_token.isEmpty())
        request.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + m_token;
    return request;
}

void GitHubSource::repos(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(makeUrl(kBaseUrl, QStringLiteral("/user/repos"),
                                             {{QStringLiteral("sort"), QStringLiteral("updated")},
                                              {QStringLiteral("per_page"), QString::number(kListLimit)}}));
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch GitHub repos"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Repository>(array, &Repository::fromGitHub, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void GitHubSource::issues(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(makeUrl(kBaseUrl, QStringLiteral("/issues"),
                                             {{QStringLiteral("filter"), QStringLiteral("assigned")},
                                              {QStringLiteral("sort"), QStringLiteral("updated")},
                                              {QStringLiteral("per_page"), QString::number(kListLimit)}}));
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch GitHub issues"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Issue>(array, &Issue::fromGitHub, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void GitHubSource::myPulls(const EndpointRequest&, EndpointReply reply) const
{
    const StatusMessages messages{QStringLiteral("Failed to fetch GitHub pull requests"), {}};

    auto userRequest = authorizedRequest(makeUrl(kBaseUrl, QStringLiteral("/user")));
    if (!userRequest) {
        reply(std::unexpected(userRequest.error()));
        return;
    }

    // The search needs the login, so the two calls run one after the other.
    fetchObject(*userRequest, messages, [this, messages, reply](Result<QJsonObject> user) {
        if (!user) {
            reply(std::unexpected(user.error()));
            return;
        }
        auto login = json_fields::requireString(*user, QStringLiteral("login"), QStringLiteral("GitHub user"));
        if (!login) {
            reply(std::unexpected(login.error()));
            return;
        }

        auto searchRequest = authorizedRequest(
            makeUrl(kBaseUrl, QStringLiteral("/search/issues"),
                    {{QStringLiteral("q"), QStringLiteral("is:pr is:open involves:%1").arg(*login)},
                     {QStringLiteral("sort"), QStringLiteral("updated")},
                     {QStringLiteral("per_page"), QString::number(kListLimit)}}));
        if (!searchRequest) {
            reply(std::unexpected(searchRequest.error()));
            return;
        }

        fetchObject(*searchRequest, messages,
                    thenReply<QJsonObject>(reply, [](const QJsonObject& result) -> Result<QJsonValue> {
                        // A search without matches may omit "items".
                        const QJsonArray items = result.value(QStringLiteral("items")).toArray();
                        auto records = json_fields::mapObjects<PullRequest>(items, &PullRequest::fromGitHub, kListLimit);
                        if (!records)
                            return std::unexpected(records.error());
                        return toJsonList(*records);
                    }));
    });
}

void GitHubSource::repoPulls(const EndpointRequest& request, EndpointReply reply) const
{
    const QString owner = request.pathParam(QStringLiteral("owner"));
    const QString repo = request.pathParam(QStringLiteral("repo"));

    auto upstream = authorizedRequest(makeUrl(
        kBaseUrl, QStringLiteral("/repos/%1/%2/pulls").arg(segment(owner), segment(repo))));
    if (!upstream) {
        reply(std::unexpected(upstream.error()));
        return;
    }

    fetchArray(*upstream,
               {QStringLiteral("Failed to fetch pull requests for %1/%2").arg(owner, repo),
                QStringLiteral("Repository %1/%2 not found.").arg(owner, repo)},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<PullRequest>(array, &PullRequest::fromGitHub);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void GitHubSource::releases(const EndpointRequest& request, EndpointReply reply) const
{
    const QString owner = request.pathParam(QStringLiteral("owner"));
    const QString repo = request.pathParam(QStringLiteral("repo"));

    const UpstreamRequest upstream = optionalAuthRequest(makeUrl(
        kBaseUrl, QStringLiteral("/repos/%1/%2/releases").arg(segment(owner), segment(repo)),
        {{QStringLiteral("per_page"), QString::number(kReleaseLimit)}}));

    fetchArray(upstream,
               {QStringLiteral("Error fetching releases"),
                QStringLiteral("Repository '%1/%2' not found.").arg(owner, repo)},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   QList<Release> records;
                   for (const QJsonValue& value : array) {
                       if (records.size() >= kReleaseLimit)
                           break;
                       records.append(Release::fromGitHub(value.toObject()));
                   }
                   return toJsonList(records);
               }));
}
