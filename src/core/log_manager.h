#pragma once
#include <QFile>
#include <QMutex>
#include <QString>

class LogManager {
public:
    static LogManager& instance();

    // Empty logDir keeps output on stderr only.
    void initialize(const QString& logDir);

    enum Level { Debug, Info, Warning, Error };

    void setDebugEnabled(bool enabled) { m_debugEnabled = enabled; }
    bool debugEnabled() const { return m_debugEnabled; }
    void setConsoleEnabled(bool enabled) { m_consoleEnabled = enabled; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "gateway", msg); }
    void info(const QString& msg)    { log(Info, "gateway", msg); }
    void warning(const QString& msg) { log(Warning, "gateway", msg); }
    void error(const QString& msg)   { log(Error, "gateway", msg); }

    QString logFilePath() const { return m_logFile.fileName(); }

    static QString formatMessage(Level level, const QString& category, const QString& message);

private:
    ~LogManager();
    LogManager() = default;
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    QFile m_logFile;
    QMutex m_mutex;
    bool m_debugEnabled = false;
    bool m_consoleEnabled = true;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
