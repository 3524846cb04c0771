#ifndef MEMTASK_HTTP_ROUTEDESCRIPTOR_HPP
#define MEMTASK_HTTP_ROUTEDESCRIPTOR_HPP

#include <QString>
#include <QVector>
#include <QtHttpServer/QHttpServerRequest>

enum class BodyShape {
    None,
    Task,
    TaskArray,
    Text,
};

struct RouteResponse {
    int status = 200;
    QString description;
    BodyShape body = BodyShape::None;
};

// Introspectable description of one registered route. `path` uses the
// OpenAPI template syntax ("/api/v1/tasks/{id}").
struct RouteDescriptor {
    QHttpServerRequest::Method method = QHttpServerRequest::Method::Get;
    QString path;
    QString operationId;
    QString summary;
    QString description;
    QString idParameterDescription;
    bool consumesTask = false;
    QVector<RouteResponse> responses;

    bool hasIdParameter() const { return !idParameterDescription.isEmpty(); }
};

#endif // MEMTASK_HTTP_ROUTEDESCRIPTOR_HPP
