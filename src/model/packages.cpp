#include "packages.h"
#include "json_fields.h"

using namespace json_fields;

QJsonObject PackageInfo::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["version"] = version;
    obj["summary"] = summary;
    obj["author"] = json_fields::toJson(author);
    obj["home_page"] = json_fields::toJson(homePage);
    return obj;
}

PackageInfo PackageInfo::fromPyPI(const QJsonObject& info)
{
    PackageInfo package;
    package.name = stringOr(info, "name", QStringLiteral("No Name"));
    package.version = stringOr(info, "version", QStringLiteral("0.0.0"));
    package.summary = stringOr(info, "summary", QString());
    package.author = optionalString(info, "author");
    package.homePage = optionalString(info, "home_page");
    return package;
}

QJsonObject NpmPackage::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["description"] = description;
    obj["latest_version"] = latestVersion;
    obj["homepage"] = json_fields::toJson(homepage);
    return obj;
}

NpmPackage NpmPackage::fromRegistry(const QJsonObject& doc, const QString& requestedName)
{
    NpmPackage package;
    package.name = stringOr(doc, "name", requestedName);
    package.description = stringOr(doc, "description", QString());
    package.latestVersion = stringOr(doc.value("dist-tags").toObject(), "latest",
                                     QStringLiteral("0.0.0"));
    package.homepage = optionalString(doc, "homepage");
    return package;
}

Result<NpmPackage> NpmPackage::fromSearchResult(const QJsonObject& package)
{
    auto name = requireString(package, "name", QStringLiteral("npm search result"));
    if (!name) return std::unexpected(name.error());

    NpmPackage result;
    result.name = *name;
    result.description = stringOr(package, "description", QString());
    result.latestVersion = stringOr(package, "version", QStringLiteral("0.0.0"));
    result.homepage = optionalString(package.value("links").toObject(), "homepage");
    return result;
}

QJsonObject LatestVersion::toJson() const
{
    QJsonObject obj;
    obj["package_name"] = packageName;
    obj["latest_version"] = latestVersion;
    return obj;
}

LatestVersion LatestVersion::fromPyPI(const QJsonObject& info, const QString& requestedName)
{
    return LatestVersion{stringOr(info, "name", requestedName),
                         stringOr(info, "version", QStringLiteral("0.0.0"))};
}

LatestVersion LatestVersion::fromNpm(const NpmPackage& package)
{
    return LatestVersion{package.name, package.latestVersion};
}
