#pragma once
#include "adapters/source_adapter.h"

class NpmSource : public SourceAdapter {
public:
    explicit NpmSource(IUpstreamClient& client);
    ~NpmSource() override = default;

    QString prefix() const override { return QStringLiteral("npm"); }
    QString displayName() const override { return QStringLiteral("npm"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    void search(const EndpointRequest& request, EndpointReply reply) const;
    void package(const EndpointRequest& request, EndpointReply reply) const;
    void latest(const EndpointRequest& request, EndpointReply reply) const;

    void fetchDocument(const QString& packageName, const QString& context,
                       Continuation<QJsonObject> next) const;
};
