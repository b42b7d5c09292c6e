#include "competitive.h"
#include "json_fields.h"
#include <QDateTime>
#include <QTimeZone>

using namespace json_fields;

QJsonObject Contest::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = name;
    obj["phase"] = phase;
    obj["link"] = link;
    return obj;
}

Result<Contest> Contest::fromCodeforces(const QJsonObject& obj)
{
    const QString record = QStringLiteral("Codeforces contest");
    auto id = requireInt(obj, "id", record);
    if (!id) return std::unexpected(id.error());
    auto name = requireString(obj, "name", record);
    if (!name) return std::unexpected(name.error());
    auto phase = requireString(obj, "phase", record);
    if (!phase) return std::unexpected(phase.error());
    return Contest{*id, *name, *phase,
                   QStringLiteral("https://codeforces.com/contest/%1").arg(*id)};
}

QJsonObject UserProfile::toJson() const
{
    QJsonObject obj;
    obj["handle"] = handle;
    obj["firstName"] = json_fields::toJson(firstName);
    obj["lastName"] = json_fields::toJson(lastName);
    obj["country"] = json_fields::toJson(country);
    obj["organization"] = json_fields::toJson(organization);
    obj["rating"] = json_fields::toJson(rating);
    obj["maxRating"] = json_fields::toJson(maxRating);
    obj["rank"] = json_fields::toJson(rank);
    obj["maxRank"] = json_fields::toJson(maxRank);
    obj["lastOnline"] = json_fields::toJson(lastOnline);
    obj["profileLink"] = profileLink;
    return obj;
}

Result<UserProfile> UserProfile::fromCodeforces(const QJsonObject& obj)
{
    auto handle = requireString(obj, "handle", QStringLiteral("Codeforces user"));
    if (!handle) return std::unexpected(handle.error());

    UserProfile profile;
    profile.handle = *handle;
    profile.firstName = optionalString(obj, "firstName");
    profile.lastName = optionalString(obj, "lastName");
    profile.country = optionalString(obj, "country");
    profile.organization = optionalString(obj, "organization");
    profile.rating = optionalInt(obj, "rating");
    profile.maxRating = optionalInt(obj, "maxRating");
    profile.rank = optionalString(obj, "rank");
    profile.maxRank = optionalString(obj, "maxRank");
    profile.lastOnline = formatEpoch(optionalInt(obj, "lastOnlineTimeSeconds"));
    profile.profileLink = QStringLiteral("https://codeforces.com/profile/%1").arg(*handle);
    return profile;
}

std::optional<QString> UserProfile::formatEpoch(std::optional<qint64> seconds)
{
    if (!seconds || *seconds == 0)
        return std::nullopt;
    return QDateTime::fromSecsSinceEpoch(*seconds, QTimeZone::utc())
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
}

QJsonObject Dataset::toJson() const
{
    QJsonObject obj;
    obj["title"] = title;
    obj["ref"] = ref;
    obj["url"] = url;
    return obj;
}

Result<Dataset> Dataset::fromKaggle(const QJsonObject& obj)
{
    const QString record = QStringLiteral("Kaggle dataset");
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto ref = requireString(obj, "ref", record);
    if (!ref) return std::unexpected(ref.error());
    return Dataset{*title, *ref, QStringLiteral("https://www.kaggle.com/datasets/%1").arg(*ref)};
}

QJsonObject Competition::toJson() const
{
    QJsonObject obj;
    obj["ref"] = ref;
    obj["title"] = title;
    obj["deadline"] = deadline;
    return obj;
}

Result<Competition> Competition::fromKaggle(const QJsonObject& obj)
{
    const QString record = QStringLiteral("Kaggle competition");
    auto ref = requireString(obj, "ref", record);
    if (!ref) return std::unexpected(ref.error());
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto deadline = requireString(obj, "deadline", record);
    if (!deadline) return std::unexpected(deadline.error());
    return Competition{*ref, *title, *deadline};
}

QJsonObject GfgStats::toJson() const
{
    QJsonObject obj;
    obj["totalSolved"] = json_fields::toJson(totalSolved);
    obj["easy"] = json_fields::toJson(easy);
    obj["medium"] = json_fields::toJson(medium);
    obj["hard"] = json_fields::toJson(hard);
    return obj;
}

GfgStats GfgStats::fromStatsService(const QJsonObject& obj)
{
    GfgStats stats;
    stats.totalSolved = optionalInt(obj, "totalProblemsSolved");
    stats.easy = optionalInt(obj, "easy");
    stats.medium = optionalInt(obj, "medium");
    stats.hard = optionalInt(obj, "hard");
    return stats;
}

QJsonObject ProblemOfTheDay::toJson() const
{
    QJsonObject obj;
    obj["title"] = title;
    obj["link"] = link;
    return obj;
}
