#ifndef MEMTASK_HTTP_OPENAPIDOCUMENT_HPP
#define MEMTASK_HTTP_OPENAPIDOCUMENT_HPP

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "RouteDescriptor.hpp"

struct ApiInfo {
    QString title = QStringLiteral("memtask");
    QString version = QStringLiteral("v1");
    QString tag = QStringLiteral("Tasks API");
};

// Renders an OpenAPI 3.0 document for the given route table, including
// the Task schema and example payloads.
QJsonObject buildOpenApiDocument(const QVector<RouteDescriptor> &routes,
                                 const ApiInfo &info = ApiInfo());

#endif // MEMTASK_HTTP_OPENAPIDOCUMENT_HPP
