#pragma once
#include "result.h"
#include <QJsonObject>
#include <QString>
#include <optional>

struct PackageInfo {
    QString name;
    QString version;
    QString summary;
    std::optional<QString> author;
    std::optional<QString> homePage;

    QJsonObject toJson() const;
    // Expects the "info" object of the PyPI JSON API.
    static PackageInfo fromPyPI(const QJsonObject& info);
};

struct NpmPackage {
    QString name;
    QString description;
    QString latestVersion;
    std::optional<QString> homepage;

    QJsonObject toJson() const;
    // Full registry document (GET /<name>).
    static NpmPackage fromRegistry(const QJsonObject& doc, const QString& requestedName);
    // "package" object of a search result.
    static Result<NpmPackage> fromSearchResult(const QJsonObject& package);
};

struct LatestVersion {
    QString packageName;
    QString latestVersion;

    QJsonObject toJson() const;
    static LatestVersion fromPyPI(const QJsonObject& info, const QString& requestedName);
    static LatestVersion fromNpm(const NpmPackage& package);
};
