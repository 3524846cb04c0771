#ifndef MEMTASK_HTTP_DOCSROUTER_HPP
#define MEMTASK_HTTP_DOCSROUTER_HPP

#include <QJsonObject>
#include <QVector>

#include "IRouter.hpp"
#include "OpenApiDocument.hpp"
#include "RouteDescriptor.hpp"

// Serves the OpenAPI description of a route table. Optional: nothing else
// depends on it being registered.
class DocsRouter : public IRouter {
public:
    static constexpr const char *kDocumentPath = "/swagger/v1/swagger.json";

    explicit DocsRouter(QVector<RouteDescriptor> routes, ApiInfo info = ApiInfo());

    const char *name() const override { return "docs"; }
    void registerRoutes(QHttpServer &server) override;

    const QJsonObject &document() const { return m_document; }

private:
    QJsonObject m_document;
};

#endif // MEMTASK_HTTP_DOCSROUTER_HPP
