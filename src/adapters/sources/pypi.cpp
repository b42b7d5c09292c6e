#include "pypi.h"
#include "model/packages.h"

namespace {

const QString kBaseUrl = QStringLiteral("https://pypi.org/pypi");

}

PyPISource::PyPISource(IUpstreamClient& client)
    : SourceAdapter(client)
{
}

QString PyPISource::exampleEndpoint() const
{
    return QStringLiteral("/pypi/requests");
}

QString PyPISource::description() const
{
    return QStringLiteral("Fetch Python package details or the latest version from PyPI.");
}

QList<Endpoint> PyPISource::endpoints()
{
    return {
        {QStringLiteral("GET"), QStringLiteral("/{package_name}"),
         QStringLiteral("Package details"),
         [this](const EndpointRequest& r, EndpointReply reply) { package(r, std::move(reply)); }},
        {QStringLiteral("GET"), QStringLiteral("/{package_name}/latest"),
         QStringLiteral("Latest version of a package"),
         [this](const EndpointRequest& r, EndpointReply reply) { latest(r, std::move(reply)); }},
    };
}

void PyPISource::fetchInfo(const QString& packageName, const QString& context,
                           Continuation<QJsonObject> next) const
{
    UpstreamRequest request;
    request.url = makeUrl(kBaseUrl, QStringLiteral("/%1/json").arg(segment(packageName)));

    fetchObject(request,
                {context, QStringLiteral("Package '%1' not found on PyPI.").arg(packageName)},
                [this, next = std::move(next)](Result<QJsonObject> doc) {
        if (!doc) {
            next(std::unexpected(doc.error()));
            return;
        }
        const QJsonValue info = doc->value(QStringLiteral("info"));
        if (!info.isObject()) {
            next(std::unexpected(json_fields::missingField(displayName(), QStringLiteral("info"))));
            return;
        }
        next(info.toObject());
    });
}

void PyPISource::package(const EndpointRequest& request, EndpointReply reply) const
{
    fetchInfo(request.pathParam(QStringLiteral("package_name")),
              QStringLiteral("Error fetching package details"),
              thenReply<QJsonObject>(std::move(reply), [](const QJsonObject& info) -> Result<QJsonValue> {
                  return QJsonValue(PackageInfo::fromPyPI(info).toJson());
              }));
}

void PyPISource::latest(const EndpointRequest& request, EndpointReply reply) const
{
    const QString packageName = request.pathParam(QStringLiteral("package_name"));
    fetchInfo(packageName, QStringLiteral("Error fetching package version"),
              thenReply<QJsonObject>(std::move(reply), [packageName](const QJsonObject& info) -> Result<QJsonValue> {
                  return QJsonValue(LatestVersion::fromPyPI(info, packageName).toJson());
              }));
}
