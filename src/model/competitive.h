#pragma once
#include "result.h"
#include <QJsonObject>
#include <QString>
#include <optional>

struct Contest {
    qint64 id = 0;
    QString name;
    QString phase;
    QString link;

    QJsonObject toJson() const;
    static Result<Contest> fromCodeforces(const QJsonObject& obj);
};

struct UserProfile {
    QString handle;
    std::optional<QString> firstName;
    std::optional<QString> lastName;
    std::optional<QString> country;
    std::optional<QString> organization;
    std::optional<qint64> rating;
    std::optional<qint64> maxRating;
    std::optional<QString> rank;
    std::optional<QString> maxRank;
    std::optional<QString> lastOnline;
    QString profileLink;

    QJsonObject toJson() const;
    static Result<UserProfile> fromCodeforces(const QJsonObject& obj);

    // "yyyy-MM-dd HH:mm:ss" in UTC; nullopt for a zero or absent timestamp.
    static std::optional<QString> formatEpoch(std::optional<qint64> seconds);
};

struct Dataset {
    QString title;
    QString ref;
    QString url;

    QJsonObject toJson() const;
    static Result<Dataset> fromKaggle(const QJsonObject& obj);
};

struct Competition {
    QString ref;
    QString title;
    QString deadline;

    QJsonObject toJson() const;
    static Result<Competition> fromKaggle(const QJsonObject& obj);
};

struct GfgStats {
    std::optional<qint64> totalSolved;
    std::optional<qint64> easy;
    std::optional<qint64> medium;
    std::optional<qint64> hard;

    QJsonObject toJson() const;
    static GfgStats fromStatsService(const QJsonObject& obj);
};

struct ProblemOfTheDay {
    QString title;
    QString link;

    QJsonObject toJson() const;
};
