#ifndef MEMTASK_CONFIG_SERVERCONFIG_HPP
#define MEMTASK_CONFIG_SERVERCONFIG_HPP

#include <QCommandLineParser>
#include <QHostAddress>
#include <QString>
#include <optional>

// Runtime settings, layered as: defaults < INI file (--config) <
// MEMTASK_ENVIRONMENT < command line.
struct ServerConfig {
    QHostAddress host = QHostAddress(QHostAddress::Any);
    quint16 port = 8080;
    QString logFile = QStringLiteral("memtask.log");
    // Newline separated, as QLoggingCategory::setFilterRules() expects.
    QString logRules = QStringLiteral("memtask.*=true");
    bool docsEnabled = false;
    bool requireTitleOnCreate = false;

    static void configureParser(QCommandLineParser &parser);

    // Expects a parser set up by configureParser() that has already parsed
    // the arguments.
    static std::optional<ServerConfig> fromParser(const QCommandLineParser &parser,
                                                  QString *outError = nullptr);

    // Applies the keys of an INI file on top of this config.
    bool loadFile(const QString &path, QString *outError = nullptr);
};

// Accepts "any", "localhost" or a literal address.
std::optional<QHostAddress> parseHost(const QString &value);
std::optional<quint16> parsePort(const QString &value);

#endif // MEMTASK_CONFIG_SERVERCONFIG_HPP
