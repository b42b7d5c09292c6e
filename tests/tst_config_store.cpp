#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QProcessEnvironment>
#include "config/config_store.h"
#include "config/config_types.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsWithoutAnySource() {
        ConfigStore store;
        const GatewayConfig& config = store.config();

        QCOMPARE(config.server.host, QStringLiteral("127.0.0.1"));
        QCOMPARE(config.server.port, 8000);
        QCOMPARE(config.server.upstreamTimeout, 10000);
        QVERIFY(config.server.logDir.isEmpty());
        QVERIFY(!config.server.debugMode);
        QCOMPARE(config.server.allowedOrigins, ConfigStore::defaultAllowedOrigins());
        QCOMPARE(config.credentials.gitlabUrl, QStringLiteral("https://gitlab.com"));
        QVERIFY(config.credentials.githubToken.isEmpty());
        QVERIFY(!config.defaults.stackOverflowUserId.has_value());
    }

    void testDefaultOriginsIncludeHostedFrontend() {
        const QStringList origins = ConfigStore::defaultAllowedOrigins();
        QCOMPARE(origins.size(), 4);
        QVERIFY(origins.contains(QStringLiteral("http://localhost:8001")));
        QVERIFY(origins.contains(QStringLiteral("https://developer-aggregator-kuqj.vercel.app")));
    }

    void testParseDotEnv() {
        const QByteArray content =
            "# credentials\n"
            "GITHUB_TOKEN=ghp_abc\n"
            "export DEVTO_API_KEY = \"quoted value\"\n"
            "KAGGLE_KEY='single'\n"
            "GITLAB_URL=https://gitlab.example.com # self-hosted\n"
            "not a pair\n"
            "\n";
        const QMap<QString, QString> values = ConfigStore::parseDotEnv(content);

        QCOMPARE(values.value(QStringLiteral("GITHUB_TOKEN")), QStringLiteral("ghp_abc"));
        QCOMPARE(values.value(QStringLiteral("DEVTO_API_KEY")), QStringLiteral("quoted value"));
        QCOMPARE(values.value(QStringLiteral("KAGGLE_KEY")), QStringLiteral("single"));
        QCOMPARE(values.value(QStringLiteral("GITLAB_URL")), QStringLiteral("https://gitlab.example.com"));
        QCOMPARE(values.size(), 4);
    }

    void testEnvironmentOverridesDotEnv() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/.env");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("GITLAB_TOKEN=from-file\nCODEFORCES_HANDLE=tourist\n");
        file.close();

        ConfigStore store;
        QVERIFY(store.loadDotEnv(path));

        QProcessEnvironment env;
        env.insert(QStringLiteral("GITLAB_TOKEN"), QStringLiteral("from-env"));
        env.insert(QStringLiteral("UNRELATED"), QStringLiteral("x"));
        store.loadEnvironment(env);

        QCOMPARE(store.config().credentials.gitlabToken, QStringLiteral("from-env"));
        QCOMPARE(store.config().defaults.codeforcesHandle, QStringLiteral("tourist"));
    }

    void testOverrideWinsOverEnvironment() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("DEVGATE_PORT"), QStringLiteral("9000"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().server.port, 9000);

        store.setOverride(config_keys::kPort, QStringLiteral("9100"));
        QCOMPARE(store.config().server.port, 9100);
    }

    void testMissingDotEnvIsNotAnError() {
        ConfigStore store;
        QVERIFY(!store.loadDotEnv(QStringLiteral("/nonexistent/devgate/.env")));
        QCOMPARE(store.config().server.port, 8000);
    }

    void testGithubTokenAlias() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("GITHUB_API_TOKEN"), QStringLiteral("legacy"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().credentials.githubToken, QStringLiteral("legacy"));

        env.insert(QStringLiteral("GITHUB_TOKEN"), QStringLiteral("primary"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().credentials.githubToken, QStringLiteral("primary"));
    }

    void testStackOverflowUserIdMustBeNumeric() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("STACKOVERFLOW_USER_ID"), QStringLiteral("jon"));
        store.loadEnvironment(env);
        QVERIFY(!store.config().defaults.stackOverflowUserId.has_value());

        env.insert(QStringLiteral("STACKOVERFLOW_USER_ID"), QStringLiteral("22656"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().defaults.stackOverflowUserId.value_or(0), qint64(22656));
    }

    void testTimeoutIsClamped() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("DEVGATE_UPSTREAM_TIMEOUT_MS"), QStringLiteral("50"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().server.upstreamTimeout, 1000);

        env.insert(QStringLiteral("DEVGATE_UPSTREAM_TIMEOUT_MS"), QStringLiteral("999999"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().server.upstreamTimeout, 120000);

        env.insert(QStringLiteral("DEVGATE_UPSTREAM_TIMEOUT_MS"), QStringLiteral("soon"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().server.upstreamTimeout, 10000);
    }

    void testAllowedOriginsList() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("DEVGATE_ALLOWED_ORIGINS"),
                   QStringLiteral(" https://a.example , https://b.example,,"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().server.allowedOrigins,
                 (QStringList{QStringLiteral("https://a.example"), QStringLiteral("https://b.example")}));
    }

    void testGitlabUrlTrailingSlashIsDropped() {
        ConfigStore store;
        QProcessEnvironment env;
        env.insert(QStringLiteral("GITLAB_URL"), QStringLiteral("https://gitlab.example.com/"));
        env.insert(QStringLiteral("DEVGATE_DEBUG"), QStringLiteral("true"));
        store.loadEnvironment(env);
        QCOMPARE(store.config().credentials.gitlabUrl, QStringLiteral("https://gitlab.example.com"));
        QVERIFY(store.config().server.debugMode);
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
