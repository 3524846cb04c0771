#include "ServerConfig.hpp"

#include <QFileInfo>
#include <QSettings>
#include <limits>

namespace {

const char *const kEnvironmentVariable = "MEMTASK_ENVIRONMENT";

const QString kOptConfig = QStringLiteral("config");
const QString kOptHost = QStringLiteral("host");
const QString kOptPort = QStringLiteral("port");
const QString kOptLogFile = QStringLiteral("log-file");
const QString kOptLogRules = QStringLiteral("log-rules");
const QString kOptDocs = QStringLiteral("docs");
const QString kOptStrictCreate = QStringLiteral("require-title-on-create");

bool setError(QString *outError, const QString &message) {
    if (outError) {
        *outError = message;
    }
    return false;
}

} // END NAMESPACE

std::optional<QHostAddress> parseHost(const QString &value) {
    const QString trimmed = value.trimmed();
    if (trimmed.compare(QLatin1String("any"), Qt::CaseInsensitive) == 0) {
        return QHostAddress(QHostAddress::Any);
    }
    if (trimmed.compare(QLatin1String("localhost"), Qt::CaseInsensitive) == 0) {
        return QHostAddress(QHostAddress::LocalHost);
    }

    const QHostAddress address(trimmed);
    if (address.isNull()) {
        return std::nullopt;
    }
    return address;
}

std::optional<quint16> parsePort(const QString &value) {
    bool ok = false;
    const uint port = value.trimmed().toUInt(&ok);
    if (!ok || port > std::numeric_limits<quint16>::max()) {
        return std::nullopt;
    }
    return static_cast<quint16>(port);
}

void ServerConfig::configureParser(QCommandLineParser &parser) {
    parser.setApplicationDescription(
        QStringLiteral("In-memory task tracking HTTP service."));
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        {kOptConfig, QStringLiteral("Read settings from an INI <file>."),
         QStringLiteral("file")},
        {kOptHost, QStringLiteral("Listen address: any, localhost or an IP."),
         QStringLiteral("address")},
        {kOptPort, QStringLiteral("Listen port (0 picks a free port)."),
         QStringLiteral("port")},
        {kOptLogFile, QStringLiteral("Append logs to <file>; empty for stderr only."),
         QStringLiteral("file")},
        {kOptLogRules, QStringLiteral("Logging category filter rules."),
         QStringLiteral("rules")},
        {kOptDocs, QStringLiteral("Serve the OpenAPI document.")},
        {kOptStrictCreate,
         QStringLiteral("Reject create requests with an empty title.")},
    });
}

bool ServerConfig::loadFile(const QString &path, QString *outError) {
    if (!QFileInfo::exists(path)) {
        return setError(outError, QStringLiteral("Config file not found: %1").arg(path));
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return setError(outError, QStringLiteral("Cannot read config file: %1").arg(path));
    }

    if (settings.contains(QStringLiteral("server/host"))) {
        const QString value = settings.value(QStringLiteral("server/host")).toString();
        const auto parsed = parseHost(value);
        if (!parsed) {
            return setError(outError, QStringLiteral("Invalid server/host: %1").arg(value));
        }
        host = *parsed;
    }

    if (settings.contains(QStringLiteral("server/port"))) {
        const QString value = settings.value(QStringLiteral("server/port")).toString();
        const auto parsed = parsePort(value);
        if (!parsed) {
            return setError(outError, QStringLiteral("Invalid server/port: %1").arg(value));
        }
        port = *parsed;
    }

    logFile = settings.value(QStringLiteral("logging/file"), logFile).toString();
    if (settings.contains(QStringLiteral("logging/rules"))) {
        // QSettings hands back comma-separated values as a list.
        logRules = settings.value(QStringLiteral("logging/rules")).toStringList().join('\n');
    }
    docsEnabled = settings.value(QStringLiteral("api/docs"), docsEnabled).toBool();
    requireTitleOnCreate =
        settings.value(QStringLiteral("api/requireTitleOnCreate"), requireTitleOnCreate)
            .toBool();

    return true;
}

std::optional<ServerConfig> ServerConfig::fromParser(const QCommandLineParser &parser,
                                                     QString *outError) {
    ServerConfig config;

    if (parser.isSet(kOptConfig) && !config.loadFile(parser.value(kOptConfig), outError)) {
        return std::nullopt;
    }

    if (qEnvironmentVariable(kEnvironmentVariable)
            .compare(QLatin1String("Development"), Qt::CaseInsensitive) == 0) {
        config.docsEnabled = true;
    }

    if (parser.isSet(kOptHost)) {
        const auto parsed = parseHost(parser.value(kOptHost));
        if (!parsed) {
            setError(outError,
                     QStringLiteral("Invalid --host: %1").arg(parser.value(kOptHost)));
            return std::nullopt;
        }
        config.host = *parsed;
    }

    if (parser.isSet(kOptPort)) {
        const auto parsed = parsePort(parser.value(kOptPort));
        if (!parsed) {
            setError(outError,
                     QStringLiteral("Invalid --port: %1").arg(parser.value(kOptPort)));
            return std::nullopt;
        }
        config.port = *parsed;
    }

    if (parser.isSet(kOptLogFile)) {
        config.logFile = parser.value(kOptLogFile);
    }
    if (parser.isSet(kOptLogRules)) {
        config.logRules = parser.value(kOptLogRules).split(',').join('\n');
    }
    if (parser.isSet(kOptDocs)) {
        config.docsEnabled = true;
    }
    if (parser.isSet(kOptStrictCreate)) {
        config.requireTitleOnCreate = true;
    }

    return config;
}
