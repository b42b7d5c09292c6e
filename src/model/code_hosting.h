#pragma once
#include "result.h"
#include <QJsonObject>
#include <QString>
#include <optional>

struct Release {
    QString tagName;
    std::optional<QString> name;
    QString url;
    QString publishedAt;

    QJsonObject toJson() const;
    static Release fromGitHub(const QJsonObject& obj);
};

// A GitHub repository or a GitLab project.
struct Repository {
    qint64 id = 0;
    QString name;
    QString url;

    QJsonObject toJson() const;
    static Result<Repository> fromGitHub(const QJsonObject& obj);
    static Result<Repository> fromGitLab(const QJsonObject& obj);
};

struct Issue {
    qint64 id = 0;
    QString title;
    QString url;

    QJsonObject toJson() const;
    static Result<Issue> fromGitHub(const QJsonObject& obj);
    static Result<Issue> fromGitLab(const QJsonObject& obj);
};

struct PullRequest {
    qint64 id = 0;
    QString title;
    QString url;
    QString user;

    QJsonObject toJson() const;
    static Result<PullRequest> fromGitHub(const QJsonObject& obj);
};

struct PipelineRun {
    QString project;
    qint64 pipelineId = 0;
    QString status;
    QString url;

    QJsonObject toJson() const;
    static Result<PipelineRun> fromGitLab(const QString& projectName, const QJsonObject& obj);
};
