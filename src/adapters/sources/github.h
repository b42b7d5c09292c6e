#pragma once
#include "adapters/source_adapter.h"
#include "config/config_types.h"

class GitHubSource : public SourceAdapter {
public:
    GitHubSource(IUpstreamClient& client, const SourceCredentials& credentials);
    ~GitHubSource() override = default;

    QString prefix() const override { return QStringLiteral("github"); }
    QString displayName() const override { return QStringLiteral("GitHub"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    QString m_token;

    void repos(const EndpointRequest& request, EndpointReply reply) const;
    void issues(const EndpointRequest& request, EndpointReply reply) const;
    void myPulls(const EndpointRequest& request, EndpointReply reply) const;
    void repoPulls(const EndpointRequest& request, EndpointReply reply) const;
    void releases(const EndpointRequest& request, EndpointReply reply) const;

    // Fails with a configuration error when no token is set.
    Result<UpstreamRequest> authorizedRequest(const QUrl& url) const;
    UpstreamRequest optionalAuthRequest(const QUrl& url) const;
};
