#include <QtCore/QFile>
#include <QtCore/QTextStream>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QDebug>

#include <cstdio>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore,  "memtask.core")
Q_LOGGING_CATEGORY(appHttp,  "memtask.http")
Q_LOGGING_CATEGORY(appStore, "memtask.store")

static QFile *g_logFile = nullptr;
static QMutex g_logMutex;

static void messageHandler(QtMsgType type, const QMessageLogContext &ctx, const QString &msg)
{
    const QString line = qFormatLogMessage(type, ctx, msg) + '\n';

    QMutexLocker lock(&g_logMutex);
    fprintf(stderr, "%s", line.toLocal8Bit().constData());

    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << line;
        ts.flush();
    }
}

void initLogging(const QString &filePath) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    QString openError;
    {
        QMutexLocker lock(&g_logMutex);
        if (g_logFile) {
            g_logFile->close();
            delete g_logFile;
            g_logFile = nullptr;
        }

        if (!filePath.isEmpty()) {
            g_logFile = new QFile(filePath);
            if (!g_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                openError = g_logFile->errorString();
                delete g_logFile;
                g_logFile = nullptr;
            }
        }
    }

    qInstallMessageHandler(messageHandler);

    if (!openError.isEmpty()) {
        qWarning(appCore) << "Failed to open log file:" << filePath << openError;
    }

    qInfo(appCore) << "Logging initialized"
                   << (g_logFile ? QString("-> %1").arg(filePath) : QString("(stderr only)"));
}

const char *toString(QHttpServerRequest::Method m) {
    using M = QHttpServerRequest::Method;
    switch (m) {
    case M::Get: return "GET";
    case M::Post: return "POST";
    case M::Put: return "PUT";
    case M::Delete: return "DELETE";
    case M::Patch: return "PATCH";
    case M::Head: return "HEAD";
    case M::Options: return "OPTIONS";
    case M::Trace: return "TRACE";
    case M::Connect: return "CONNECT";
    default: return "UNKNOWN";
    }
}
