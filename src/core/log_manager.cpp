#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {
const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString timestampNow() {
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}
}

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

bool LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return true;

    QDir().mkpath(logDir);
    const QString logPath = QDir(logDir).filePath(QStringLiteral("ccproxy.log"));
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
        return false;
    }
    return true;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level < m_minLevel)
        return;

    const QString timestamp = timestampNow();
    const QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);

    {
        // Requests log from the server thread and the pool's callers alike.
        QMutexLocker locker(&m_mutex);
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
        const QByteArray line = formatted.toUtf8() + '\n';
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}
