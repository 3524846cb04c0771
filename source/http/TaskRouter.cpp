#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "Task.hpp"
#include "TaskInput.hpp"
#include "TaskRouter.hpp"

using StatusCode = QHttpServerResponse::StatusCode;

TaskRouter::TaskRouter(std::shared_ptr<ITaskService> service)
    : m_service(std::move(service)) {}

// Accepts "xxxxxxxx-xxxx-...", "{...}", "(...)" and 32 bare hex digits.
// QUuid::fromString() answers null both for garbage and for the nil UUID,
// so a null result only counts as a failure when the text is not all zeros.
static std::optional<QUuid> parseTaskId(const QString &string) {
    static const QRegularExpression hexOnly(QStringLiteral("^[0-9A-Fa-f]{32}$"));

    QString text = string.trimmed();
    if (hexOnly.match(text).hasMatch()) {
        text = QStringLiteral("%1-%2-%3-%4-%5")
                   .arg(text.mid(0, 8), text.mid(8, 4), text.mid(12, 4),
                        text.mid(16, 4), text.mid(20));
    } else if (text.startsWith('(') && text.endsWith(')')) {
        text = QStringLiteral("{%1}").arg(text.mid(1, text.size() - 2));
    }

    const QUuid id = QUuid::fromString(text);
    if (!id.isNull()) {
        return id;
    }

    const QString nil = QUuid().toString(QUuid::WithoutBraces);
    if (text == nil || text == QUuid().toString(QUuid::WithBraces)) {
        return id;
    }
    return std::nullopt;
}

static QHttpServerResponse invalidBody(const QString &reason) {
    return makeText(QStringLiteral("Invalid request body: ") + reason,
                    StatusCode::BadRequest);
}

static QHttpServerResponse invalidId() {
    return makeText(QStringLiteral("Invalid task id."), StatusCode::BadRequest);
}

static QHttpServerResponse titleRequired() {
    return makeText(QStringLiteral("Title is required."), StatusCode::BadRequest);
}

static std::optional<TaskInput> bindTaskInput(const QByteArray &body,
                                              QString *outError) {
    const auto payload = parseBodyObject(body, outError);
    if (!payload) {
        return std::nullopt;
    }
    return TaskInput::fromJson(*payload, outError);
}

// ─────────────────────────────────────────────────────────────────────────────
// Route table
// ─────────────────────────────────────────────────────────────────────────────
const QVector<RouteDescriptor> &TaskRouter::routes() {
    using M = QHttpServerRequest::Method;
    const QString collection = QString::fromLatin1(kBasePath) + '/';
    const QString item = QString::fromLatin1(kBasePath) + QStringLiteral("/{id}");

    static const QVector<RouteDescriptor> table{
        {M::Post, collection, "createTask", "Create a new task",
         "Creates a new task with a unique ID.", {}, true,
         {{201, "Task created successfully.", BodyShape::Task},
          {400, "Malformed request body", BodyShape::Text}}},
        {M::Get, collection, "listTasks", "Retrieve all tasks",
         "Returns a list of all existing tasks.", {}, false,
         {{200, "List of tasks", BodyShape::TaskArray}}},
        {M::Get, item, "getTask", "Get a task by ID",
         "Returns a specific task by its ID.", "Unique task ID (GUID)", false,
         {{200, "Task found", BodyShape::Task},
          {404, "Task not found", BodyShape::None}}},
        {M::Put, item, "updateTask", "Update an existing task",
         "Updates a task with the specified ID.", "ID of the task to update", true,
         {{200, "Updated task", BodyShape::Task},
          {400, "Invalid input", BodyShape::Text},
          {404, "Task not found", BodyShape::None}}},
        {M::Delete, item, "deleteTask", "Delete a task",
         "Deletes a task by its unique ID.", "ID of the task to delete", false,
         {{204, "Task deleted", BodyShape::None},
          {404, "Task not found", BodyShape::None}}},
    };
    return table;
}

// ─────────────────────────────────────────────────────────────────────────────
// Handlers
// ─────────────────────────────────────────────────────────────────────────────
QHttpServerResponse TaskRouter::listTasks(const QString &requestId) const {
    qInfo(appHttp) << "[GET]" << kBasePath << "| requestId=" << requestId;

    QJsonArray items;
    for (const Task &task : m_service->getAllTasks()) {
        items.append(task.toJson());
    }
    return makeJsonArray(items);
}

QHttpServerResponse TaskRouter::getTask(const QString &idArg,
                                        const QString &requestId) const {
    qInfo(appHttp) << "[GET]" << kBasePath << "id=" << idArg
                   << "| requestId=" << requestId;

    const auto taskId = parseTaskId(idArg);
    if (!taskId) {
        return invalidId();
    }

    const auto task = m_service->getTaskById(*taskId);
    if (!task) {
        return makeEmpty(StatusCode::NotFound);
    }
    return makeJson(task->toJson());
}

QHttpServerResponse TaskRouter::createTask(const QByteArray &body,
                                           const QString &requestId) {
    qInfo(appHttp) << "[POST]" << kBasePath << "bytes=" << body.size()
                   << "| requestId=" << requestId;

    QString bindError;
    const auto input = bindTaskInput(body, &bindError);
    if (!input) {
        return invalidBody(bindError);
    }

    TaskError error = TaskError::None;
    const auto created = m_service->createTask(*input, &error);
    if (!created) {
        if (error == TaskError::InvalidTitle) {
            return titleRequired();
        }
        return makeText(QStringLiteral("Failed to store task."),
                        StatusCode::InternalServerError);
    }

    const QString location = QStringLiteral("%1/%2").arg(
        QString::fromLatin1(kBasePath),
        created->id.toString(QUuid::WithoutBraces));
    return withHeader(makeJson(created->toJson(), StatusCode::Created),
                      "Location", location);
}

QHttpServerResponse TaskRouter::updateTask(const QString &idArg,
                                           const QByteArray &body,
                                           const QString &requestId) {
    qInfo(appHttp) << "[PUT]" << kBasePath << "id=" << idArg
                   << "bytes=" << body.size() << "| requestId=" << requestId;

    const auto taskId = parseTaskId(idArg);
    if (!taskId) {
        return invalidId();
    }

    QString bindError;
    const auto input = bindTaskInput(body, &bindError);
    if (!input) {
        return invalidBody(bindError);
    }

    TaskError error = TaskError::None;
    const auto updated = m_service->updateTask(*taskId, *input, &error);
    if (!updated) {
        switch (error) {
        case TaskError::NotFound:
            return makeEmpty(StatusCode::NotFound);
        case TaskError::InvalidTitle:
            return titleRequired();
        default:
            return makeText(QStringLiteral("Failed to update task."),
                            StatusCode::InternalServerError);
        }
    }

    return makeJson(updated->toJson());
}

QHttpServerResponse TaskRouter::deleteTask(const QString &idArg,
                                           const QString &requestId) {
    qInfo(appHttp) << "[DELETE]" << kBasePath << "id=" << idArg
                   << "| requestId=" << requestId;

    const auto taskId = parseTaskId(idArg);
    if (!taskId) {
        return invalidId();
    }

    if (!m_service->deleteTask(*taskId)) {
        return makeEmpty(StatusCode::NotFound);
    }
    return makeEmpty(StatusCode::NoContent);
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────
void TaskRouter::registerRoutes(QHttpServer &server) {
    using PathHandler = std::function<QHttpServerResponse(
        const QString &, const QHttpServerRequest &, const QString &)>;
    using BodyHandler = std::function<QHttpServerResponse(
        const QHttpServerRequest &, const QString &)>;
    using PlainHandler = std::function<QHttpServerResponse(const QString &)>;

    const QString collectionPath = QString::fromLatin1(kBasePath);
    const QString itemPath = collectionPath + QStringLiteral("/<arg>");

    const auto mirrorRoute = [&server](const QString &path,
                                       QHttpServerRequest::Method method,
                                       auto handler) {
        server.route(path, method, handler);
        server.route(path + '/', method, handler);
    };

    // GET /api/v1/tasks
    mirrorRoute(collectionPath, QHttpServerRequest::Method::Get,
                wrapSafe("GET /api/v1/tasks",
                         PlainHandler([this](const QString &requestId) {
                             return listTasks(requestId);
                         })));

    // POST /api/v1/tasks
    mirrorRoute(collectionPath, QHttpServerRequest::Method::Post,
                wrapSafe("POST /api/v1/tasks",
                         BodyHandler([this](const QHttpServerRequest &request,
                                            const QString &requestId) {
                             return createTask(request.body(), requestId);
                         })));

    // GET /api/v1/tasks/{id}
    server.route(itemPath, QHttpServerRequest::Method::Get,
                 wrapSafe("GET /api/v1/tasks/{id}",
                          PathHandler([this](const QString &id,
                                             const QHttpServerRequest &,
                                             const QString &requestId) {
                              return getTask(id, requestId);
                          })));

    // PUT /api/v1/tasks/{id}
    server.route(itemPath, QHttpServerRequest::Method::Put,
                 wrapSafe("PUT /api/v1/tasks/{id}",
                          PathHandler([this](const QString &id,
                                             const QHttpServerRequest &request,
                                             const QString &requestId) {
                              return updateTask(id, request.body(), requestId);
                          })));

    // DELETE /api/v1/tasks/{id}
    server.route(itemPath, QHttpServerRequest::Method::Delete,
                 wrapSafe("DELETE /api/v1/tasks/{id}",
                          PathHandler([this](const QString &id,
                                             const QHttpServerRequest &,
                                             const QString &requestId) {
                              return deleteTask(id, requestId);
                          })));
}
