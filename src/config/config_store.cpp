#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QList>

namespace {

const QList<QString>& knownKeys()
{
    static const QList<QString> keys = {
        config_keys::kGithubToken, config_keys::kGithubApiToken,
        config_keys::kGitlabUrl, config_keys::kGitlabToken,
        config_keys::kDevtoApiKey,
        config_keys::kKaggleUsername, config_keys::kKaggleKey,
        config_keys::kCodeforcesHandle,
        config_keys::kStackOverflowUserId, config_keys::kStackOverflowUsername,
        config_keys::kAllowedOrigins, config_keys::kHost, config_keys::kPort,
        config_keys::kUpstreamTimeout, config_keys::kLogDir, config_keys::kDebug,
    };
    return keys;
}

int intSetting(const QString& raw, const QString& key, int fallback, int minValue, int maxValue)
{
    if (raw.isEmpty())
        return fallback;
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok) {
        LOG_WARNING(QStringLiteral("ConfigStore: %1=%2 is not an integer, using %3")
                        .arg(key, raw)
                        .arg(fallback));
        return fallback;
    }
    return qBound(minValue, value, maxValue);
}

bool boolSetting(const QString& raw)
{
    const QString value = raw.trimmed().toLower();
    return value == QStringLiteral("1") || value == QStringLiteral("true")
        || value == QStringLiteral("yes") || value == QStringLiteral("on");
}

QString unquote(const QString& raw)
{
    QString value = raw.trimmed();
    if (value.size() >= 2) {
        const QChar first = value.front();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && value.back() == first)
            return value.mid(1, value.size() - 2);
    }
    // Unquoted values may carry a trailing " # comment".
    const qsizetype comment = value.indexOf(QStringLiteral(" #"));
    if (comment >= 0)
        value = value.left(comment).trimmed();
    return value;
}

}

ConfigStore::ConfigStore()
{
    rebuild();
}

QStringList ConfigStore::defaultAllowedOrigins()
{
    return {
        QStringLiteral("http://localhost:8001"),
        QStringLiteral("http://127.0.0.1:8001"),
        QStringLiteral("http://0.0.0.0:8001"),
        QStringLiteral("https://developer-aggregator-kuqj.vercel.app"),
    };
}

QMap<QString, QString> ConfigStore::parseDotEnv(const QByteArray& content)
{
    QMap<QString, QString> values;
    const QStringList lines = QString::fromUtf8(content).split(QLatin1Char('\n'));
    for (QString line : lines) {
        line = line.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;
        if (line.startsWith(QStringLiteral("export ")))
            line = line.mid(7).trimmed();

        const qsizetype eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0)
            continue;
        const QString key = line.left(eq).trimmed();
        if (key.isEmpty())
            continue;
        values[key] = unquote(line.mid(eq + 1));
    }
    return values;
}

bool ConfigStore::loadDotEnv(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return false;

    m_dotEnv = parseDotEnv(file.readAll());
    LOG_DEBUG(QStringLiteral("ConfigStore: loaded %1 entries from %2")
                  .arg(m_dotEnv.size())
                  .arg(path));
    rebuild();
    return true;
}

void ConfigStore::loadEnvironment(const QProcessEnvironment& env)
{
    m_environment.clear();
    for (const QString& key : knownKeys()) {
        if (env.contains(key))
            m_environment[key] = env.value(key);
    }
    rebuild();
}

void ConfigStore::setOverride(const QString& key, const QString& value)
{
    m_overrides[key] = value;
    rebuild();
}

QString ConfigStore::value(const QString& key) const
{
    if (m_overrides.contains(key))
        return m_overrides.value(key);
    if (m_environment.contains(key))
        return m_environment.value(key);
    return m_dotEnv.value(key);
}

void ConfigStore::rebuild()
{
    GatewayConfig config;

    SourceCredentials& creds = config.credentials;
    creds.githubToken = value(config_keys::kGithubToken).trimmed();
    if (creds.githubToken.isEmpty())
        creds.githubToken = value(config_keys::kGithubApiToken).trimmed();
    const QString gitlabUrl = value(config_keys::kGitlabUrl).trimmed();
    if (!gitlabUrl.isEmpty()) {
        creds.gitlabUrl = gitlabUrl;
        while (creds.gitlabUrl.endsWith(QLatin1Char('/')))
            creds.gitlabUrl.chop(1);
    }
    creds.gitlabToken = value(config_keys::kGitlabToken).trimmed();
    creds.devtoApiKey = value(config_keys::kDevtoApiKey).trimmed();
    creds.kaggleUsername = value(config_keys::kKaggleUsername).trimmed();
    creds.kaggleKey = value(config_keys::kKaggleKey).trimmed();

    DefaultIdentities& defaults = config.defaults;
    defaults.codeforcesHandle = value(config_keys::kCodeforcesHandle).trimmed();
    defaults.stackOverflowUsername = value(config_keys::kStackOverflowUsername).trimmed();
    const QString userId = value(config_keys::kStackOverflowUserId).trimmed();
    if (!userId.isEmpty()) {
        bool ok = false;
        const qint64 parsed = userId.toLongLong(&ok);
        if (ok && parsed > 0) {
            defaults.stackOverflowUserId = parsed;
        } else {
            LOG_WARNING(QStringLiteral("ConfigStore: ignoring non-numeric %1=%2")
                            .arg(config_keys::kStackOverflowUserId, userId));
        }
    }

    ServerOptions& server = config.server;
    const QString host = value(config_keys::kHost).trimmed();
    if (!host.isEmpty())
        server.host = host;
    server.port = intSetting(value(config_keys::kPort), config_keys::kPort, 8000, 1, 65535);
    server.upstreamTimeout = intSetting(value(config_keys::kUpstreamTimeout),
                                        config_keys::kUpstreamTimeout, 10000, 1000, 120000);
    server.logDir = value(config_keys::kLogDir).trimmed();
    server.debugMode = boolSetting(value(config_keys::kDebug));

    const QString origins = value(config_keys::kAllowedOrigins);
    if (origins.trimmed().isEmpty()) {
        server.allowedOrigins = defaultAllowedOrigins();
    } else {
        for (const QString& origin : origins.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const QString trimmed = origin.trimmed();
            if (!trimmed.isEmpty())
                server.allowedOrigins.append(trimmed);
        }
    }

    m_config = config;
}
