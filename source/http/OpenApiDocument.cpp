#include "OpenApiDocument.hpp"

#include <QJsonArray>

#include "Logger.hpp"

namespace {

const QString kTaskRef = QStringLiteral("#/components/schemas/Task");

QJsonObject exampleTask() {
    return QJsonObject{{"id", "d3b9f0f5-e2c1-4a7e-a2cf-72e578a6e7df"},
                       {"title", "Buy groceries"},
                       {"description", "Milk, Bread, Eggs"},
                       {"isCompleted", false}};
}

QJsonObject anotherExampleTask() {
    return QJsonObject{{"id", "5a1e2b3f-6c4d-7890-1234-abcdefabcdef"},
                       {"title", "Finish assignment"},
                       {"description", "Complete the Swagger/OpenAPI docs task"},
                       {"isCompleted", true}};
}

QJsonObject taskSchema() {
    return QJsonObject{
        {"type", "object"},
        {"required", QJsonArray{"title"}},
        {"properties",
         QJsonObject{
             {"id", QJsonObject{{"type", "string"},
                                {"format", "uuid"},
                                {"readOnly", true}}},
             {"title", QJsonObject{{"type", "string"}, {"minLength", 1}}},
             {"description", QJsonObject{{"type", "string"}, {"nullable", true}}},
             {"isCompleted", QJsonObject{{"type", "boolean"}, {"default", false}}}}}};
}

QJsonObject mediaFor(BodyShape shape) {
    switch (shape) {
    case BodyShape::Task:
        return QJsonObject{
            {"application/json",
             QJsonObject{{"schema", QJsonObject{{"$ref", kTaskRef}}},
                         {"example", exampleTask()}}}};
    case BodyShape::TaskArray:
        return QJsonObject{
            {"application/json",
             QJsonObject{{"schema", QJsonObject{{"type", "array"},
                                                {"items", QJsonObject{{"$ref", kTaskRef}}}}},
                         {"example", QJsonArray{exampleTask(), anotherExampleTask()}}}}};
    case BodyShape::Text:
        return QJsonObject{
            {"text/plain",
             QJsonObject{{"schema", QJsonObject{{"type", "string"}}}}}};
    case BodyShape::None:
        break;
    }
    return QJsonObject{};
}

QJsonObject operationFor(const RouteDescriptor &route, const QString &tag) {
    QJsonObject operation{{"tags", QJsonArray{tag}},
                          {"operationId", route.operationId},
                          {"summary", route.summary},
                          {"description", route.description}};

    if (route.hasIdParameter()) {
        operation.insert("parameters",
                         QJsonArray{QJsonObject{
                             {"name", "id"},
                             {"in", "path"},
                             {"required", true},
                             {"description", route.idParameterDescription},
                             {"schema", QJsonObject{{"type", "string"},
                                                    {"format", "uuid"}}}}});
    }

    if (route.consumesTask) {
        operation.insert("requestBody",
                         QJsonObject{{"required", true},
                                     {"content", mediaFor(BodyShape::Task)}});
    }

    QJsonObject responses;
    for (const RouteResponse &response : route.responses) {
        QJsonObject entry{{"description", response.description}};
        const QJsonObject content = mediaFor(response.body);
        if (!content.isEmpty()) {
            entry.insert("content", content);
        }
        responses.insert(QString::number(response.status), entry);
    }
    operation.insert("responses", responses);

    return operation;
}

} // END NAMESPACE

QJsonObject buildOpenApiDocument(const QVector<RouteDescriptor> &routes,
                                 const ApiInfo &info) {
    QJsonObject paths;
    for (const RouteDescriptor &route : routes) {
        QJsonObject pathItem = paths.value(route.path).toObject();
        pathItem.insert(QString::fromLatin1(toString(route.method)).toLower(),
                        operationFor(route, info.tag));
        paths.insert(route.path, pathItem);
    }

    return QJsonObject{
        {"openapi", "3.0.1"},
        {"info", QJsonObject{{"title", info.title}, {"version", info.version}}},
        {"tags", QJsonArray{QJsonObject{{"name", info.tag}}}},
        {"paths", paths},
        {"components",
         QJsonObject{{"schemas", QJsonObject{{"Task", taskSchema()}}}}}};
}
