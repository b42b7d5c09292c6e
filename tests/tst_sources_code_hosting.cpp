#include <QTest>
#include "fake_upstream_client.h"
#include "endpoint_harness.h"
#include "adapters/sources/github.h"
#include "adapters/sources/gitlab.h"

namespace {

QJsonObject githubRepo(int id)
{
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = QStringLiteral("repo-%1").arg(id);
    obj["html_url"] = QStringLiteral("https://github.com/octo/repo-%1").arg(id);
    return obj;
}

QJsonObject gitlabPipeline(int id, const QString& status)
{
    QJsonObject obj;
    obj["id"] = id;
    obj["status"] = status;
    obj["web_url"] = QStringLiteral("https://gitlab.com/p/-/pipelines/%1").arg(id);
    return obj;
}

SourceCredentials credentials()
{
    SourceCredentials creds;
    creds.githubToken = QStringLiteral("ghp_test");
    creds.gitlabToken = QStringLiteral("glpat_test");
    return creds;
}

}

class TestCodeHostingSources : public QObject {
    Q_OBJECT

private slots:
    void testGithubRequiresTokenBeforeAnyRequest() {
        FakeUpstreamClient upstream;
        GitHubSource source(upstream, SourceCredentials{});

        auto result = callEndpoint(source, QStringLiteral("/repos"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Configuration);
        QVERIFY(result.error().message.contains(QStringLiteral("GITHUB_TOKEN")));
        QCOMPARE(upstream.requestCount(), 0);
    }

    void testGithubReposAreCappedAndAuthorized() {
        FakeUpstreamClient upstream;
        QJsonArray repos;
        for (int i = 1; i <= 12; ++i)
            repos.append(githubRepo(i));
        upstream.respondJson(QStringLiteral("https://api.github.com/user/repos?sort=updated&per_page=10"), repos);

        GitHubSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/repos"));
        QVERIFY(result.has_value());
        const QJsonArray list = result->toArray();
        QCOMPARE(list.size(), 10);
        QCOMPARE(list.first().toObject().value("name").toString(), QStringLiteral("repo-1"));
        QCOMPARE(upstream.received().first().headers.value(QStringLiteral("Authorization")),
                 QStringLiteral("Bearer ghp_test"));
    }

    void testGithubPullsResolveLoginFirst() {
        FakeUpstreamClient upstream;
        QJsonObject user;
        user["login"] = QStringLiteral("octo");
        upstream.respondJson(QStringLiteral("https://api.github.com/user"), user);
        upstream.respondJson(QStringLiteral(
            "https://api.github.com/search/issues?q=is%3Apr%20is%3Aopen%20involves%3Aocto&sort=updated&per_page=10"),
            QJsonObject{{"total_count", 0}});

        GitHubSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/pulls"));
        QVERIFY(result.has_value());
        QVERIFY(result->toArray().isEmpty());
        QCOMPARE(upstream.requestCount(), 2);
    }

    void testGithubRepoPullsNotFoundNamesRepository() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://api.github.com/repos/octo/missing/pulls"), 404,
                         "{\"message\":\"Not Found\"}");

        GitHubSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/repos/{owner}/{repo}/pulls"),
                                   {{QStringLiteral("owner"), QStringLiteral("octo")},
                                    {QStringLiteral("repo"), QStringLiteral("missing")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 404);
        QCOMPARE(result.error().message, QStringLiteral("Repository octo/missing not found."));
    }

    void testGithubReleasesWorkWithoutToken() {
        FakeUpstreamClient upstream;
        QJsonObject release;
        release["tag_name"] = QStringLiteral("v1.0");
        release["html_url"] = QStringLiteral("https://github.com/qt/qtbase/releases/v1.0");
        upstream.respondJson(QStringLiteral("https://api.github.com/repos/qt/qtbase/releases?per_page=30"),
                             QJsonArray{release});

        GitHubSource source(upstream, SourceCredentials{});
        auto result = callEndpoint(source, QStringLiteral("/{owner}/{repo}/releases"),
                                   {{QStringLiteral("owner"), QStringLiteral("qt")},
                                    {QStringLiteral("repo"), QStringLiteral("qtbase")}});
        QVERIFY(result.has_value());
        QCOMPARE(result->toArray().first().toObject().value("tag_name").toString(), QStringLiteral("v1.0"));
        QVERIFY(!upstream.received().first().headers.contains(QStringLiteral("Authorization")));
    }

    void testGithubReleasesNotFound() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://api.github.com/repos/qt/nope/releases?per_page=30"), 404, "{}");

        GitHubSource source(upstream, SourceCredentials{});
        auto result = callEndpoint(source, QStringLiteral("/{owner}/{repo}/releases"),
                                   {{QStringLiteral("owner"), QStringLiteral("qt")},
                                    {QStringLiteral("repo"), QStringLiteral("nope")}});
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().message, QStringLiteral("Repository 'qt/nope' not found."));
    }

    void testGithubUpstreamStatusPassesThrough() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral("https://api.github.com/issues?filter=assigned&sort=updated&per_page=10"),
                         401, "{\"message\":\"Bad credentials\"}");

        GitHubSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/issues"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 401);
        QVERIFY(result.error().message.contains(QStringLiteral("Bad credentials")));
    }

    void testGithubUnreachable() {
        FakeUpstreamClient upstream;
        GitHubSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/repos"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 503);
        QCOMPARE(result.error().message, QStringLiteral("Could not connect to the GitHub API."));
    }

    void testGitlabRequiresToken() {
        FakeUpstreamClient upstream;
        GitLabSource source(upstream, SourceCredentials{});
        auto result = callEndpoint(source, QStringLiteral("/pipelines"));
        QVERIFY(!result.has_value());
        QVERIFY(result.error().message.contains(QStringLiteral("GITLAB_TOKEN")));
        QCOMPARE(upstream.requestCount(), 0);
    }

    void testGitlabPipelinesFanOutAndSkipFailures() {
        FakeUpstreamClient upstream;
        QJsonArray projects;
        for (int i = 1; i <= 3; ++i) {
            QJsonObject project;
            project["id"] = i;
            project["name"] = QStringLiteral("project-%1").arg(i);
            projects.append(project);
        }
        const QString base = QStringLiteral("https://gitlab.com/api/v4");
        upstream.respondJson(base + QStringLiteral("/projects?owned=true&order_by=last_activity_at&sort=desc&per_page=3"),
                             projects);
        upstream.respondJson(base + QStringLiteral("/projects/1/pipelines?per_page=3"),
                             QJsonArray{gitlabPipeline(11, QStringLiteral("success")),
                                        gitlabPipeline(12, QStringLiteral("failed"))});
        // project 2 is unreachable
        upstream.respond(base + QStringLiteral("/projects/3/pipelines?per_page=3"), 500, "oops");

        GitLabSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/pipelines"));
        QVERIFY(result.has_value());

        const QJsonArray runs = result->toArray();
        QCOMPARE(runs.size(), 2);
        QCOMPARE(runs.at(0).toObject().value("pipeline_id").toInteger(), qint64(11));
        QCOMPARE(runs.at(1).toObject().value("status").toString(), QStringLiteral("failed"));
        QCOMPARE(runs.at(0).toObject().value("project").toString(), QStringLiteral("project-1"));
        QCOMPARE(upstream.batchCount(), 1);
        QCOMPARE(upstream.requestCount(), 4);
        for (const UpstreamRequest& request : upstream.received())
            QCOMPARE(request.headers.value(QStringLiteral("PRIVATE-TOKEN")), QStringLiteral("glpat_test"));
    }

    void testGitlabPipelinesFirstStageFailureFails() {
        FakeUpstreamClient upstream;
        upstream.respond(QStringLiteral(
            "https://gitlab.com/api/v4/projects?owned=true&order_by=last_activity_at&sort=desc&per_page=3"),
            403, "{\"message\":\"403 Forbidden\"}");

        GitLabSource source(upstream, credentials());
        auto result = callEndpoint(source, QStringLiteral("/pipelines"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().httpStatus(), 403);
        QCOMPARE(upstream.batchCount(), 0);
    }

    void testGitlabCustomInstance() {
        FakeUpstreamClient upstream;
        QJsonObject project;
        project["id"] = 4;
        project["name"] = QStringLiteral("infra");
        project["web_url"] = QStringLiteral("https://gitlab.example.com/infra");
        upstream.respondJson(QStringLiteral(
            "https://gitlab.example.com/api/v4/projects?owned=true&order_by=created_at&sort=desc&per_page=10"),
            QJsonArray{project});

        SourceCredentials creds = credentials();
        creds.gitlabUrl = QStringLiteral("https://gitlab.example.com");
        GitLabSource source(upstream, creds);
        auto result = callEndpoint(source, QStringLiteral("/projects"));
        QVERIFY(result.has_value());
        QCOMPARE(result->toArray().first().toObject().value("url").toString(),
                 QStringLiteral("https://gitlab.example.com/infra"));
    }
};

QTEST_MAIN(TestCodeHostingSources)
#include "tst_sources_code_hosting.moc"
