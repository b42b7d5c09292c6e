#pragma once
#include "adapters/source_adapter.h"
#include "config/config_types.h"

class CodeforcesSource : public SourceAdapter {
public:
    CodeforcesSource(IUpstreamClient& client, const DefaultIdentities& defaults);
    ~CodeforcesSource() override = default;

    QString prefix() const override { return QStringLiteral("codeforces"); }
    QString displayName() const override { return QStringLiteral("Codeforces"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    QString m_defaultHandle;

    void contests(const EndpointRequest& request, EndpointReply reply) const;
    void myProfile(const EndpointRequest& request, EndpointReply reply) const;
    void profile(const EndpointRequest& request, EndpointReply reply) const;

    void fetchProfile(const QString& handle, EndpointReply reply) const;
    Result<QJsonValue> shapeProfile(const QString& handle, const Result<UpstreamResponse>& response) const;
};
