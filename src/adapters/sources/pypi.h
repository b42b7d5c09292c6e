#pragma once
#include "adapters/source_adapter.h"

class PyPISource : public SourceAdapter {
public:
    explicit PyPISource(IUpstreamClient& client);
    ~PyPISource() override = default;

    QString prefix() const override { return QStringLiteral("pypi"); }
    QString displayName() const override { return QStringLiteral("PyPI"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    void package(const EndpointRequest& request, EndpointReply reply) const;
    void latest(const EndpointRequest& request, EndpointReply reply) const;

    // The "info" object of the package's JSON document.
    void fetchInfo(const QString& packageName, const QString& context,
                   Continuation<QJsonObject> next) const;
};
