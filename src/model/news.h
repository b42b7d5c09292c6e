#pragma once
#include "result.h"
#include <QJsonObject>
#include <QList>
#include <QString>
#include <optional>

// A Hacker News story, from either the Firebase item API or Algolia search.
struct Story {
    qint64 id = 0;
    QString title;
    std::optional<QString> url;
    qint64 points = 0;
    QString author;
    qint64 time = 0;
    QString type;
    qint64 descendants = 0;

    QJsonObject toJson() const;

    // Both return nullopt for items without an id or a title.
    static std::optional<Story> fromHackerNewsItem(const QJsonObject& obj);
    // Any item kind looked up by id; a missing title reads "N/A".
    static Result<Story> fromHackerNewsItemDetail(const QJsonObject& obj);
    static std::optional<Story> fromAlgoliaHit(const QJsonObject& obj);
};

struct HackerNewsUser {
    QString id;
    qint64 created = 0;
    qint64 karma = 0;
    std::optional<QString> about;
    QList<qint64> submitted;

    QJsonObject toJson() const;
    static Result<HackerNewsUser> fromHackerNews(const QJsonObject& obj);
};

struct Post {
    QString id;
    QString title;
    QString subreddit;
    QString url;
    QString author;
    qint64 score = 0;

    QJsonObject toJson() const;
    static Result<Post> fromReddit(const QJsonObject& data, const QString& requestedSubreddit);
};

struct Article {
    qint64 id = 0;
    QString title;
    QString url;
    std::optional<QString> author;
    QString tags;

    QJsonObject toJson() const;
    static Result<Article> fromDevTo(const QJsonObject& obj);
};
