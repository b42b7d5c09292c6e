#include "code_hosting.h"
#include "json_fields.h"

using namespace json_fields;

QJsonObject Release::toJson() const
{
    QJsonObject obj;
    obj["tag_name"] = tagName;
    obj["name"] = json_fields::toJson(name);
    obj["url"] = url;
    obj["published_at"] = publishedAt;
    return obj;
}

Release Release::fromGitHub(const QJsonObject& obj)
{
    Release release;
    release.tagName = stringOr(obj, "tag_name", QStringLiteral("No Tag"));
    release.name = optionalString(obj, "name");
    release.url = stringOr(obj, "html_url", QString());
    // Drafts have no publication date yet.
    release.publishedAt = stringOr(obj, "published_at", QString());
    return release;
}

QJsonObject Repository::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = name;
    obj["url"] = url;
    return obj;
}

Result<Repository> Repository::fromGitHub(const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitHub repository");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto name = requireString(obj, "name", record);
    if (!name) return std::unexpected(name.error());
    auto url = requireString(obj, "html_url", record);
    if (!url) return std::unexpected(url.error());
    return Repository{*id, *name, *url};
}

Result<Repository> Repository::fromGitLab(const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitLab project");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto name = requireString(obj, "name", record);
    if (!name) return std::unexpected(name.error());
    auto url = requireString(obj, "web_url", record);
    if (!url) return std::unexpected(url.error());
    return Repository{*id, *name, *url};
}

QJsonObject Issue::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["url"] = url;
    return obj;
}

Result<Issue> Issue::fromGitHub(const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitHub issue");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto url = requireString(obj, "html_url", record);
    if (!url) return std::unexpected(url.error());
    return Issue{*id, *title, *url};
}

Result<Issue> Issue::fromGitLab(const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitLab issue");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto url = requireString(obj, "web_url", record);
    if (!url) return std::unexpected(url.error());
    return Issue{*id, *title, *url};
}

QJsonObject PullRequest::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["url"] = url;
    obj["user"] = user;
    return obj;
}

Result<PullRequest> PullRequest::fromGitHub(const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitHub pull request");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto url = requireString(obj, "html_url", record);
    if (!url) return std::unexpected(url.error());
    auto login = requireString(obj.value("user").toObject(), "login", record);
    if (!login) return std::unexpected(login.error());
    return PullRequest{*id, *title, *url, *login};
}

QJsonObject PipelineRun::toJson() const
{
    QJsonObject obj;
    obj["project"] = project;
    obj["pipeline_id"] = pipelineId;
    obj["status"] = status;
    obj["url"] = url;
    return obj;
}

Result<PipelineRun> PipelineRun::fromGitLab(const QString& projectName, const QJsonObject& obj)
{
    const QString record = QStringLiteral("GitLab pipeline");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto status = requireString(obj, "status", record);
    if (!status) return std::unexpected(status.error());
    auto url = requireString(obj, "web_url", record);
    if (!url) return std::unexpected(url.error());
    return PipelineRun{projectName, *id, *status, *url};
}
