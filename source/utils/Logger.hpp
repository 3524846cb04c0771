#ifndef MEMTASK_UTILS_LOGGER_HPP
#define MEMTASK_UTILS_LOGGER_HPP

#include <QtHttpServer/QHttpServerRequest>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appHttp)
Q_DECLARE_LOGGING_CATEGORY(appStore)

// Installs the message handler. Lines always go to stderr and are also
// appended to filePath when it is non-empty and can be opened.
void initLogging(const QString &filePath = QString());

const char *toString(QHttpServerRequest::Method m);

#endif // MEMTASK_UTILS_LOGGER_HPP
