#pragma once
#include "model/json_fields.h"
#include "upstream/fan_out.h"
#include "upstream/upstream_errors.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <functional>
#include <optional>
#include <utility>

// Inputs of one matched endpoint call: decoded path parameters and the raw
// query string of the inbound request.
struct EndpointRequest {
    QMap<QString, QString> pathParams;
    QUrlQuery query;

    QString pathParam(const QString& name) const { return pathParams.value(name); }
    std::optional<QString> queryValue(const QString& name) const;
};

// Receives the outcome of one endpoint call, exactly once.
using EndpointReply = std::function<void(Result<QJsonValue>)>;
using EndpointHandler = std::function<void(const EndpointRequest&, EndpointReply)>;

struct Endpoint {
    QString method = QStringLiteral("GET");
    QString pattern;
    QString summary;
    EndpointHandler handler;
};

class ISourceAdapter {
public:
    virtual ~ISourceAdapter() = default;

    // Routing prefix without slashes, e.g. "github".
    virtual QString prefix() const = 0;
    // Name used in user-facing messages, e.g. "GitHub".
    virtual QString displayName() const = 0;
    virtual QString exampleEndpoint() const = 0;
    virtual QString description() const = 0;

    virtual QList<Endpoint> endpoints() = 0;
};

class SourceAdapter : public ISourceAdapter {
public:
    ~SourceAdapter() override = default;

protected:
    explicit SourceAdapter(IUpstreamClient& client);

    template<typename T>
    using Continuation = std::function<void(Result<T>)>;

    IUpstreamClient& client() const { return m_client; }
    FanOutCoordinator fanOut() const { return FanOutCoordinator(m_client, displayName()); }

    // Single upstream calls with status mapping applied; next runs once the
    // call settles.
    void fetch(const UpstreamRequest& request, const StatusMessages& messages,
               Continuation<UpstreamResponse> next) const;
    void fetchJson(const UpstreamRequest& request, const StatusMessages& messages,
                   Continuation<QJsonDocument> next) const;
    void fetchArray(const UpstreamRequest& request, const StatusMessages& messages,
                    Continuation<QJsonArray> next) const;
    void fetchObject(const UpstreamRequest& request, const StatusMessages& messages,
                     Continuation<QJsonObject> next) const;

    // Continuation that forwards a failure to reply unchanged, or replies
    // with what shape makes of the value.
    template<typename T, typename Shape>
    static Continuation<T> thenReply(EndpointReply reply, Shape shape)
    {
        return [reply = std::move(reply), shape = std::move(shape)](Result<T> result) {
            if (!result) {
                reply(std::unexpected(result.error()));
                return;
            }
            reply(shape(*result));
        };
    }

    Result<QJsonArray> requireArray(const QJsonDocument& doc) const;
    Result<QJsonObject> requireObject(const QJsonDocument& doc) const;
    Result<QJsonArray> requireArrayField(const QJsonObject& obj, const QString& key) const;

    static Result<QString> requireQuery(const EndpointRequest& request,
                                        const QString& name,
                                        int minLength = 1);
    static Result<qint64> intPathParam(const EndpointRequest& request, const QString& name);
    // Parses an optional integer query parameter; present but non-numeric is a 400.
    static Result<std::optional<qint64>> optionalIntQuery(const EndpointRequest& request,
                                                          const QString& name);

    // Percent-encodes one path segment, so identifiers are passed verbatim.
    static QString segment(const QString& raw);
    static QUrl makeUrl(const QString& base,
                        const QString& encodedPath,
                        const QList<std::pair<QString, QString>>& query = {});

    template<typename Record>
    static QJsonValue toJsonList(const QList<Record>& records)
    {
        return QJsonValue(json_fields::toJsonArray(records));
    }

private:
    IUpstreamClient& m_client;
};
