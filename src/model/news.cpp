#include "news.h"
#include "json_fields.h"
#include <QJsonArray>
#include <QStringList>

using namespace json_fields;

namespace {

const QString kRedditBaseUrl = QStringLiteral("https://www.reddit.com");

}

QJsonObject Story::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["url"] = json_fields::toJson(url);
    obj["points"] = points;
    obj["author"] = author;
    obj["time"] = time;
    obj["type"] = type;
    obj["descendants"] = descendants;
    return obj;
}

std::optional<Story> Story::fromHackerNewsItem(const QJsonObject& obj)
{
    if (stringOr(obj, "title", QString()).isEmpty())
        return std::nullopt;
    const auto story = fromHackerNewsItemDetail(obj);
    if (!story)
        return std::nullopt;
    return *story;
}

Result<Story> Story::fromHackerNewsItemDetail(const QJsonObject& obj)
{
    const auto id = requireInt(obj, "id", QStringLiteral("Hacker News item"));
    if (!id)
        return std::unexpected(id.error());

    Story story;
    story.id = *id;
    story.title = stringOr(obj, "title", QStringLiteral("N/A"));
    story.url = optionalString(obj, "url");
    story.points = intOr(obj, "score", 0);
    story.author = stringOr(obj, "by", QStringLiteral("N/A"));
    story.time = intOr(obj, "time", 0);
    story.type = stringOr(obj, "type", QStringLiteral("N/A"));
    story.descendants = intOr(obj, "descendants", 0);
    return story;
}

std::optional<Story> Story::fromAlgoliaHit(const QJsonObject& obj)
{
    const auto id = optionalInt(obj, "objectID");
    const QString title = stringOr(obj, "title", QString());
    if (!id || title.isEmpty())
        return std::nullopt;

    Story story;
    story.id = *id;
    story.title = title;
    story.url = optionalString(obj, "url");
    story.points = intOr(obj, "points", 0);
    story.author = stringOr(obj, "author", QStringLiteral("No Author"));
    story.time = intOr(obj, "created_at_i", 0);
    story.type = QStringLiteral("story");
    story.descendants = intOr(obj, "num_comments", 0);
    return story;
}

QJsonObject HackerNewsUser::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["created"] = created;
    obj["karma"] = karma;
    obj["about"] = json_fields::toJson(about);
    QJsonArray items;
    for (qint64 item : submitted)
        items.append(item);
    obj["submitted"] = items;
    return obj;
}

Result<HackerNewsUser> HackerNewsUser::fromHackerNews(const QJsonObject& obj)
{
    auto id = requireString(obj, "id", QStringLiteral("Hacker News user"));
    if (!id) return std::unexpected(id.error());

    HackerNewsUser user;
    user.id = *id;
    user.created = intOr(obj, "created", 0);
    user.karma = intOr(obj, "karma", 0);
    user.about = optionalString(obj, "about");
    for (const QJsonValue& item : obj.value("submitted").toArray()) {
        if (item.isDouble())
            user.submitted.append(item.toInteger());
    }
    return user;
}

QJsonObject Post::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["subreddit"] = subreddit;
    obj["url"] = url;
    obj["author"] = author;
    obj["score"] = score;
    return obj;
}

Result<Post> Post::fromReddit(const QJsonObject& data, const QString& requestedSubreddit)
{
    auto id = requireString(data, "id", QStringLiteral("Reddit post"));
    if (!id) return std::unexpected(id.error());

    Post post;
    post.id = *id;
    post.title = stringOr(data, "title", QStringLiteral("No Title"));
    post.subreddit = stringOr(data, "subreddit", requestedSubreddit);
    post.url = kRedditBaseUrl + stringOr(data, "permalink", QString());
    post.author = stringOr(data, "author", QStringLiteral("No Author"));
    post.score = intOr(data, "score", 0);
    return post;
}

QJsonObject Article::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["url"] = url;
    obj["author"] = json_fields::toJson(author);
    obj["tags"] = tags;
    return obj;
}

Result<Article> Article::fromDevTo(const QJsonObject& obj)
{
    auto id = requireInt(obj, "id", QStringLiteral("DEV.to article"));
    if (!id) return std::unexpected(id.error());

    Article article;
    article.id = *id;
    article.title = stringOr(obj, "title", QStringLiteral("No Title"));
    article.url = stringOr(obj, "url", QString());
    article.author = optionalString(obj.value("user").toObject(), "name");

    // The list endpoint sends tag_list as an array, the single-article one as a string.
    const QJsonValue tagList = obj.value("tag_list");
    if (tagList.isArray()) {
        QStringList tags;
        for (const QJsonValue& tag : tagList.toArray())
            tags.append(tag.toString());
        article.tags = tags.join(QStringLiteral(", "));
    } else if (tagList.isString()) {
        article.tags = tagList.toString();
    }
    return article;
}
