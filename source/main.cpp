#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTcpServer>
#include <QtHttpServer/QHttpServer>

#include <cstdio>
#include <memory>
#include <vector>

#include "DocsRouter.hpp"
#include "ErrorHandler.hpp"
#include "InMemoryStorage.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "TaskRouter.hpp"
#include "TaskServiceImpl.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("memtask"));
    QCoreApplication::setApplicationVersion(QStringLiteral(MEMTASK_VERSION));

    // ──────────────────────────────
    // 1. Configuration
    // ──────────────────────────────
    QCommandLineParser parser;
    ServerConfig::configureParser(parser);
    parser.process(app);

    QString configError;
    const auto config = ServerConfig::fromParser(parser, &configError);
    if (!config) {
        fprintf(stderr, "memtask: %s\n", qPrintable(configError));
        return 1;
    }

    initLogging(config->logFile);
    QLoggingCategory::setFilterRules(config->logRules);

    // ──────────────────────────────
    // 2. Store and service
    // ──────────────────────────────
    auto storage = std::make_shared<InMemoryStorage>();
    auto service = std::make_shared<TaskServiceImpl>(storage,
                                                     config->requireTitleOnCreate);

    // ──────────────────────────────
    // 3. Routes
    // ──────────────────────────────
    std::vector<std::unique_ptr<IRouter>> routers;
    routers.push_back(std::make_unique<TaskRouter>(service));
    if (config->docsEnabled) {
        routers.push_back(std::make_unique<DocsRouter>(TaskRouter::routes()));
    }

    QHttpServer server;
    for (const auto &router : routers) {
        router->registerRoutes(server);
        qInfo(appCore) << "Registered routes:" << router->name();
    }

    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        sendNotFound(responder, request);
    });

    // ──────────────────────────────
    // 4. Bind and run
    // ──────────────────────────────
    auto tcp = new QTcpServer(&server);
    if (!tcp->listen(config->host, config->port) || !server.bind(tcp)) {
        qCritical(appCore) << "Server failed to start on"
                           << config->host.toString() << config->port << ":"
                           << tcp->errorString();
        return 1;
    }

    qInfo(appCore) << "Server running on" << config->host.toString()
                   << "port" << tcp->serverPort()
                   << (config->docsEnabled ? "(docs enabled)" : "");
    return app.exec();
}
