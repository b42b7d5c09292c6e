#pragma once
#include "config_types.h"
#include <QByteArray>
#include <QMap>
#include <QProcessEnvironment>
#include <QString>

// Collects settings from a dotenv file, the process environment and explicit
// overrides (in increasing precedence) and builds the immutable GatewayConfig
// handed to every adapter.
class ConfigStore {
public:
    ConfigStore();

    bool loadDotEnv(const QString& path);
    void loadEnvironment(const QProcessEnvironment& env);
    void setOverride(const QString& key, const QString& value);

    QString value(const QString& key) const;
    const GatewayConfig& config() const { return m_config; }

    static QStringList defaultAllowedOrigins();
    static QMap<QString, QString> parseDotEnv(const QByteArray& content);

private:
    QMap<QString, QString> m_dotEnv;
    QMap<QString, QString> m_environment;
    QMap<QString, QString> m_overrides;
    GatewayConfig m_config;

    void rebuild();
};
