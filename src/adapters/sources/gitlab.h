#pragma once
#include "adapters/source_adapter.h"
#include "config/config_types.h"
#include "model/code_hosting.h"

class GitLabSource : public SourceAdapter {
public:
    GitLabSource(IUpstreamClient& client, const SourceCredentials& credentials);
    ~GitLabSource() override = default;

    QString prefix() const override { return QStringLiteral("gitlab"); }
    QString displayName() const override { return QStringLiteral("GitLab"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    QString m_apiBase;
    QString m_token;

    void projects(const EndpointRequest& request, EndpointReply reply) const;
    void issues(const EndpointRequest& request, EndpointReply reply) const;
    void pipelines(const EndpointRequest& request, EndpointReply reply) const;

    // One pipelines call per listed project.
    Result<QList<FanOutTask<PipelineRun>>> pipelineTasks(const QJsonArray& projects) const;

    Result<UpstreamRequest> authorizedRequest(const QString& path,
                                              const QList<std::pair<QString, QString>>& query) const;
};
