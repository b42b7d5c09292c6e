#pragma once
#include "adapters/source_adapter.h"
#include "model/news.h"

class RedditSource : public SourceAdapter {
public:
    explicit RedditSource(IUpstreamClient& client);
    ~RedditSource() override = default;

    QString prefix() const override { return QStringLiteral("reddit"); }
    QString displayName() const override { return QStringLiteral("Reddit"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    void search(const EndpointRequest& request, EndpointReply reply) const;
    void top(const EndpointRequest& request, EndpointReply reply) const;

    // Reddit rejects generic clients, so every call carries a descriptive User-Agent.
    static UpstreamRequest listingRequest(const QUrl& url);
    Result<QList<Post>> shapeListing(const QJsonObject& listing, const QString& subreddit,
                                     qsizetype cap) const;
};
