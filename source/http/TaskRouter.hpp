#ifndef MEMTASK_HTTP_TASKROUTER_HPP
#define MEMTASK_HTTP_TASKROUTER_HPP

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtHttpServer/QHttpServerResponse>
#include <memory>

#include "IRouter.hpp"
#include "ITaskService.hpp"
#include "RouteDescriptor.hpp"

class TaskRouter : public IRouter {
public:
    static constexpr const char *kBasePath = "/api/v1/tasks";

    explicit TaskRouter(std::shared_ptr<ITaskService> service);

    const char *name() const override { return "tasks"; }
    void registerRoutes(QHttpServer &server) override;

    static const QVector<RouteDescriptor> &routes();

    // Route handlers, independent of the transport.
    QHttpServerResponse listTasks(const QString &requestId) const;
    QHttpServerResponse getTask(const QString &idArg,
                                const QString &requestId) const;
    QHttpServerResponse createTask(const QByteArray &body,
                                   const QString &requestId);
    QHttpServerResponse updateTask(const QString &idArg, const QByteArray &body,
                                   const QString &requestId);
    QHttpServerResponse deleteTask(const QString &idArg,
                                   const QString &requestId);

private:
    std::shared_ptr<ITaskService> m_service;
};

#endif // MEMTASK_HTTP_TASKROUTER_HPP
