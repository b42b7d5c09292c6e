#pragma once
#include "adapters/source_adapter.h"
#include "config/config_types.h"

class StackOverflowSource : public SourceAdapter {
public:
    StackOverflowSource(IUpstreamClient& client, const DefaultIdentities& defaults);
    ~StackOverflowSource() override = default;

    QString prefix() const override { return QStringLiteral("stackoverflow"); }
    QString displayName() const override { return QStringLiteral("Stack Exchange"); }
    QString exampleEndpoint() const override;
    QString description() const override;

    QList<Endpoint> endpoints() override;

private:
    std::optional<qint64> m_defaultUserId;
    QString m_defaultUsername;

    void featured(const EndpointRequest& request, EndpointReply reply) const;
    void questions(const EndpointRequest& request, EndpointReply reply) const;
    void answers(const EndpointRequest& request, EndpointReply reply) const;
    void search(const EndpointRequest& request, EndpointReply reply) const;

    // Explicit user_id, configured id, explicit username, configured username.
    void resolveUserId(const EndpointRequest& request, Continuation<qint64> next) const;
    void lookupUserId(const QString& username, Continuation<qint64> next) const;
    void fetchItems(const QString& path,
                    const QList<std::pair<QString, QString>>& query,
                    const QString& context,
                    Continuation<QJsonArray> next) const;
};
