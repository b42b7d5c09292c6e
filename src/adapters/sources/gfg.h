#pragma once
#include "adapters/source_adapter.h"

class GeeksForGeeksSource : public SourceAdapter {
public:
    explicit GeeksForGeeksSource(IUpstreamClient& client);
    ~GeeksForGeeksSource() override = default;

    QString prefix() const override { return QStringLiteral("gfg"); }
    QString displayName() const override { return QStringLiteral("GeeksforGeeks"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    void stats(const EndpointRequest& request, EndpointReply reply) const;
    void problemOfTheDay(const EndpointRequest& request, EndpointReply reply) const;

    static Result<QJsonValue> shapeProblemOfTheDay(const Result<UpstreamResponse>& response);
};
