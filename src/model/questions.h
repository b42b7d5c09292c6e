#pragma once
#include "result.h"
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>

struct Question {
    // Only filled for search results.
    struct SearchDetails {
        QString ownerDisplayName;
        QStringList tags;
        qint64 score = 0;
        bool isAnswered = false;
    };

    qint64 questionId = 0;
    QString title;
    QString link;
    std::optional<SearchDetails> details;

    QJsonObject toJson() const;
    static Result<Question> fromStackExchange(const QJsonObject& obj);
    static Result<Question> fromStackExchangeSearch(const QJsonObject& obj);
};

struct Answer {
    qint64 answerId = 0;
    qint64 questionId = 0;
    QString link;

    QJsonObject toJson() const;
    static Result<Answer> fromStackExchange(const QJsonObject& obj);
};

struct FeaturedQuestion {
    QString title;
    QString link;
    qint64 bountyAmount = 0;
    qint64 answerCount = 0;
    QString ownerDisplayName;

    QJsonObject toJson() const;
    static Result<FeaturedQuestion> fromStackExchange(const QJsonObject& obj);
};
