#include "npm.h"
#include "model/packages.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://registry.npmjs.org");
constexpr qsizetype kSearchLimit = 10;

}

NpmSource::NpmSource(IUpstreamClient& client)
    : SourceAdapter(client)
{
}

QString NpmSource::exampleEndpoint() const
{
    return QStringLiteral("/npm/search?text=react");
}

QString NpmSource::description() const
{
    return QStringLiteral("Search the npm registry or fetch package details and latest versions.");
}

QList<Endpoint> NpmSource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/search"),
         QStringLiteral("Registry search"),
         [this](const EndpointRequest& r, EndpointReply reply) { search(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/{package_name}"),
         QStringLiteral("Package details"),
         [this](const EndpointRequest& r, EndpointReply reply) { package(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/{package_name}/latest"),
         QStringLiteral("Latest version of a package"),
         [this](const EndpointRequest& r, EndpointReply reply) { latest(r, std::move(reply)); }},
    };
}

void NpmSource::search(const EndpointRequest& request, EndpointReply reply) const
{
    auto text = requireQuery(request, QStringLiteral("text"));
    if (!text) {
        reply(std::unexpected(text.error()));
        return;
    }

    UpstreamRequest upstream;
    upstream.url = makeUrl(kBaseUrl, QStringLiteral("/-/v1/search"),
                           {{QStringLiteral("text"), *text},
                            {QStringLiteral("size"), QString::number(kSearchLimit)}});

    fetchObject(upstream, {QStringLiteral("Error searching npm"), {}},
                thenReply<QJsonObject>(std::move(reply), [](const QJsonObject& result) -> Result<QJsonValue> {
                    QList<NpmPackage> records;
                    for (const QJsonValue& entry : result.value(QStringLiteral("objects")).toArray()) {
                        if (records.size() >= kSearchLimit)
                            break;
                        auto package = NpmPackage::fromSearchResult(
                            entry.toObject().value(QStringLiteral("package")).toObject());
                        if (!package)
                            return std::unexpected(package.error());
                        records.append(*package);
                    }
                    return toJsonList(records);
                }));
}

void NpmSource::fetchDocument(const QString& packageName, const QString& context,
                              Continuation<QJsonObject> next) const
{
    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, QStringLiteral("/") + segment(packageName));
    fetchObject(request, {context, QStringLiteral("Package '%1' not found on npm.").arg(packageName)},
                std::move(next));
}

void NpmSource::package(const EndpointRequest& request, EndpointReply reply) const
{
    const QString packageName = request.pathParam(QStringLiteral("package_name"));
    fetchDocument(packageName, QStringLiteral("Error fetching npm package"),
                  thenReply<QJsonObject>(std::move(reply), [packageName](const QJsonObject& doc) -> Result<QJsonValue> {
                      return QJsonValue(NpmPackage::fromRegistry(doc, packageName).toJson());
                  }));
}

void NpmSource::latest(const EndpointRequest& request, EndpointReply reply) const
{
    const QString packageName = request.pathParam(QStringLiteral("package_name"));
    fetchDocument(packageName, QStringLiteral("Error fetching npm version"),
                  thenReply<QJsonObject>(std::move(reply), [packageName](const QJsonObject& doc) -> Result<QJsonValue> {
                      return QJsonValue(LatestVersion::fromNpm(NpmPackage::fromRegistry(doc, packageName)).toJson());
                  }));
}
