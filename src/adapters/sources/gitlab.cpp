#include "gitlab.h"
#include "model/code_hosting.h"

namespace {

constexpr qsizetype kListLimit = 10;
constexpr int kPipelineProjects = 3;
constexpr int kPipelinesPerProject = 3;

}

GitLabSource::GitLabSource(IUpstreamClient& client, const SourceCredentials& credentials)
    : SourceAdapter(client)
    , m_apiBase(credentials.gitlabUrl + QStringLiteral("/api/v4"))
    , m_token(credentials.gitlabToken)
{
}

QString GitLabSource::exampleEndpoint() const
{
    return QStringLiteral("/gitlab/projects");
}

QString GitLabSource::description() const
{
    return QStringLiteral("Fetch your GitLab projects, assigned issues and recent pipelines.");
}

QList<Endpoint> GitLabSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/projects"),
         QStringLiteral("Most recently created owned projects"),
         [this](const EndpointRequest& r, EndpointReply reply) { projects(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/issues"),
         QStringLiteral("Issues assigned to the user"),
         [this](const EndpointRequest& r, EndpointReply reply) { issues(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/pipelines"),
         QStringLiteral("Latest pipelines of the most active owned projects"),
         [this](const EndpointRequest& r, EndpointReply reply) { pipelines(r, std::move(reply)); }},
    };
}

Result<UpstreamRequest> GitLabSource::authorizedRequest(
    const QString& path, const QList<std::pair<QString, QString>>& query) const
{
    if (m_token.isEmpty())
        return std::unexpected(DomainFailure::configuration(config_keys::kGitlabToken));

    UpstreamRequest request;
    request.url = makeUrl(m_apiBase, path, query);
    request.headers[QStringLiteral("PRIVATE-TOKEN")] = m_token;
    return request;
}

void GitLabSource::projects(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(QStringLiteral("/projects"),
                                     {{QStringLiteral("owned"), QStringLiteral("true")},
                                      {QStringLiteral("order_by"), QStringLiteral("created_at")},
                                      {QStringLiteral("sort"), QStringLiteral("desc")},
                                      {QStringLiteral("per_page"), QString::number(kListLimit)}});
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch GitLab projects"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Repository>(array, &Repository::fromGitLab, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void GitLabSource::issues(const EndpointRequest&, EndpointReply reply) const
{
    auto request = authorizedRequest(QStringLiteral("/issues"),
                                     {{QStringLiteral("scope"), QStringLiteral("assigned_to_me")},
                                      {QStringLiteral("order_by"), QStringLiteral("created_at")},
                                      {QStringLiteral("sort"), QStringLiteral("desc")},
                                      {QStringLiteral("per_page"), QString::number(kListLimit)}});
    if (!request) {
        reply(std::unexpected(request.error()));
        return;
    }

    fetchArray(*request, {QStringLiteral("Failed to fetch GitLab issues"), {}},
               thenReply<QJsonArray>(std::move(reply), [](const QJsonArray& array) -> Result<QJsonValue> {
                   auto records = json_fields::mapObjects<Issue>(array, &Issue::fromGitLab, kListLimit);
                   if (!records)
                       return std::unexpected(records.error());
                   return toJsonList(*records);
               }));
}

void GitLabSource::pipelines(const EndpointRequest&, EndpointReply reply) const
{
    auto projectsRequest = authorizedRequest(
        QStringLiteral("/projects"),
        {{QStringLiteral("owned"), QStringLiteral("true")},
         {QStringLiteral("order_by"), QStringLiteral("last_activity_at")},
         {QStringLiteral("sort"), QStringLiteral("desc")},
         {QStringLiteral("per_page"), QString::number(kPipelineProjects)}});
    if (!projectsRequest) {
        reply(std::unexpected(projectsRequest.error()));
        return;
    }

    // First stage: a failure here fails the whole request.
    fetchArray(*projectsRequest,
               {QStringLiteral("Failed to fetch initial projects for pipelines"), {}},
               [this, reply](Result<QJsonArray> projects) {
        if (!projects) {
            reply(std::unexpected(projects.error()));
            return;
        }
        auto tasks = pipelineTasks(*projects);
        if (!tasks) {
            reply(std::unexpected(tasks.error()));
            return;
        }
        fanOut().run<PipelineRun>(*tasks, [reply](QList<PipelineRun> runs) {
            reply(toJsonList(runs));
        });
    });
}

Result<QList<FanOutTask<PipelineRun>>> GitLabSource::pipelineTasks(const QJsonArray& projects) const
{
    QList<FanOutTask<PipelineRun>> tasks;
    for (const QJsonValue& value : projects) {
        if (tasks.size() >= kPipelineProjects)
            break;
        const QJsonObject project = value.toObject();
        auto projectId = json_fields::requireInt(project, QStringLiteral("id"), QStringLiteral("GitLab project"));
        if (!projectId)
            return std::unexpected(projectId.error());
        const QString projectName = json_fields::stringOr(project, QStringLiteral("name"), QString());

        auto request = authorizedRequest(QStringLiteral("/projects/%1/pipelines").arg(*projectId),
                                         {{QStringLiteral("per_page"), QString::number(kPipelinesPerProject)}});
        if (!request)
            return std::unexpected(request.error());

        tasks.append(FanOutTask<PipelineRun>{*request, [this, projectName](const UpstreamResponse& response) -> Result<QList<PipelineRun>> {
            auto doc = json_fields::parseDocument(response.body, displayName());
            if (!doc)
                return std::unexpected(doc.error());
            auto array = requireArray(*doc);
            if (!array)
                return std::unexpected(array.error());
            return json_fields::mapObjects<PipelineRun>(*array, [&projectName](const QJsonObject& obj) {
                return PipelineRun::fromGitLab(projectName, obj);
            });
        }});
    }
    return tasks;
}
