#include "log_manager.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        m_logFile.close();
    }
    if (logDir.isEmpty()) {
        return;
    }

    QDir().mkpath(logDir);
    QString logPath = logDir + "/devgate.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level == Debug && !m_debugEnabled) {
        return;
    }

    const QString formatted = formatMessage(level, category, message);

    QMutexLocker locker(&m_mutex);

    if (m_consoleEnabled) {
        std::fprintf(stderr, "%s\n", formatted.toLocal8Bit().constData());
        std::fflush(stderr);
    }

    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    static const char* levelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, levelNames[level], category, message);
}
