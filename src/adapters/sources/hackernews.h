#pragma once
#include "adapters/source_adapter.h"
#include "model/news.h"

class HackerNewsSource : public SourceAdapter {
public:
    explicit HackerNewsSource(IUpstreamClient& client);
    ~HackerNewsSource() override = default;

    QString prefix() const override { return QStringLiteral("hackernews"); }
    QString displayName() const override { return QStringLiteral("Hacker News"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    // feed is "top", "new" or "best".
    void stories(const QString& feed, EndpointReply reply) const;
    void item(const EndpointRequest& request, EndpointReply reply) const;
    void user(const EndpointRequest& request, EndpointReply reply) const;
    void search(const EndpointRequest& request, EndpointReply reply) const;

    QList<FanOutTask<Story>> storyTasks(const QJsonArray& ids) const;
};
