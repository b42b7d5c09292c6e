#pragma once
#include <QString>
#include <QStringList>
#include <optional>

struct SourceCredentials {
    QString githubToken;
    QString gitlabUrl = QStringLiteral("https://gitlab.com");
    QString gitlabToken;
    QString devtoApiKey;
    QString kaggleUsername;
    QString kaggleKey;
};

// Identities used when a request does not name one.
struct DefaultIdentities {
    QString codeforcesHandle;
    std::optional<qint64> stackOverflowUserId;
    QString stackOverflowUsername;
};

struct ServerOptions {
    QString host = QStringLiteral("127.0.0.1");
    int port = 8000;
    int upstreamTimeout = 10000;
    QString logDir;
    bool debugMode = false;
    QStringList allowedOrigins;
};

struct GatewayConfig {
    SourceCredentials credentials;
    DefaultIdentities defaults;
    ServerOptions server;
};

namespace config_keys {

inline const QString kGithubToken = QStringLiteral("GITHUB_TOKEN");
inline const QString kGithubApiToken = QStringLiteral("GITHUB_API_TOKEN");
inline const QString kGitlabUrl = QStringLiteral("GITLAB_URL");
inline const QString kGitlabToken = QStringLiteral("GITLAB_TOKEN");
inline const QString kDevtoApiKey = QStringLiteral("DEVTO_API_KEY");
inline const QString kKaggleUsername = QStringLiteral("KAGGLE_USERNAME");
inline const QString kKaggleKey = QStringLiteral("KAGGLE_KEY");
inline const QString kCodeforcesHandle = QStringLiteral("CODEFORCES_HANDLE");
inline const QString kStackOverflowUserId = QStringLiteral("STACKOVERFLOW_USER_ID");
inline const QString kStackOverflowUsername = QStringLiteral("STACKOVERFLOW_USERNAME");
inline const QString kAllowedOrigins = QStringLiteral("DEVGATE_ALLOWED_ORIGINS");
inline const QString kHost = QStringLiteral("DEVGATE_HOST");
inline const QString kPort = QStringLiteral("DEVGATE_PORT");
inline const QString kUpstreamTimeout = QStringLiteral("DEVGATE_UPSTREAM_TIMEOUT_MS");
inline const QString kLogDir = QStringLiteral("DEVGATE_LOG_DIR");
inline const QString kDebug = QStringLiteral("DEVGATE_DEBUG");

}
