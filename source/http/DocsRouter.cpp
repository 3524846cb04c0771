#include "DocsRouter.hpp"

#include <functional>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"

DocsRouter::DocsRouter(QVector<RouteDescriptor> routes, ApiInfo info)
    : m_document(buildOpenApiDocument(routes, info)) {}

void DocsRouter::registerRoutes(QHttpServer &server) {
    server.route(
        QString::fromLatin1(kDocumentPath), QHttpServerRequest::Method::Get,
        wrapSafe("GET /swagger/v1/swagger.json",
                 std::function<QHttpServerResponse(const QString &)>(
                     [this](const QString &requestId) {
                         qInfo(appHttp) << "[GET]" << kDocumentPath
                                        << "| requestId=" << requestId;
                         return makeJson(m_document);
                     })));
}
