#include "questions.h"
#include "json_fields.h"
#include <QJsonArray>

using namespace json_fields;

QJsonObject Question::toJson() const
{
    QJsonObject obj;
    obj["question_id"] = questionId;
    obj["title"] = title;
    obj["link"] = link;
    if (details) {
        QJsonObject owner;
        owner["display_name"] = details->ownerDisplayName;
        obj["owner"] = owner;
        obj["tags"] = QJsonArray::fromStringList(details->tags);
        obj["score"] = details->score;
        obj["is_answered"] = details->isAnswered;
    }
    return obj;
}

Result<Question> Question::fromStackExchange(const QJsonObject& obj)
{
    const QString record = QStringLiteral("Stack Overflow question");
    auto id = requireInt(obj, "question_id", record);
    if (!id) return std::unexpected(id.error());
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto link = requireString(obj, "link", record);
    if (!link) return std::unexpected(link.error());
    return Question{*id, *title, *link, std::nullopt};
}

Result<Question> Question::fromStackExchangeSearch(const QJsonObject& obj)
{
    auto question = fromStackExchange(obj);
    if (!question) return question;

    SearchDetails details;
    details.ownerDisplayName = stringOr(obj.value("owner").toObject(), "display_name", QString());
    for (const QJsonValue& tag : obj.value("tags").toArray())
        details.tags.append(tag.toString());
    details.score = intOr(obj, "score", 0);
    details.isAnswered = boolOr(obj, "is_answered", false);
    question->details = details;
    return question;
}

QJsonObject Answer::toJson() const
{
    QJsonObject obj;
    obj["answer_id"] = answerId;
    obj["question_id"] = questionId;
    obj["link"] = link;
    return obj;
}

Result<Answer> Answer::fromStackExchange(const QJsonObject& obj)
{
    const QString record = QStringLiteral("Stack Overflow answer");
    auto answerId = requireInt(obj, "answer_id", record);
    if (!answerId) return std::unexpected(answerId.error());
    auto questionId = requireInt(obj, "question_id", record);
    if (!questionId) return std::unexpected(questionId.error());
    return Answer{*answerId, *questionId,
                  QStringLiteral("https://stackoverflow.com/a/%1").arg(*answerId)};
}

QJsonObject FeaturedQuestion::toJson() const
{
    QJsonObject obj;
    obj["title"] = title;
    obj["link"] = link;
    obj["bounty_amount"] = bountyAmount;
    obj["answer_count"] = answerCount;
    obj["owner_display_name"] = ownerDisplayName;
    return obj;
}

Result<FeaturedQuestion> FeaturedQuestion::fromStackExchange(const QJsonObject& obj)
{
    const QString record = QStringLiteral("featured question");
    auto title = requireString(obj, "title", record);
    if (!title) return std::unexpected(title.error());
    auto link = requireString(obj, "link", record);
    if (!link) return std::unexpected(link.error());

    FeaturedQuestion question;
    question.title = *title;
    question.link = *link;
    question.bountyAmount = intOr(obj, "bounty_amount", 0);
    question.answerCount = intOr(obj, "answer_count", 0);
    question.ownerDisplayName = stringOr(obj.value("owner").toObject(), "display_name", QString());
    return question;
}
