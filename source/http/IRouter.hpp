#ifndef MEMTASK_HTTP_IROUTER_HPP
#define MEMTASK_HTTP_IROUTER_HPP

#include <QtHttpServer/QHttpServer>

class IRouter {
public:
    virtual ~IRouter() = default;

    // Short label used in startup logs, e.g. "tasks".
    virtual const char *name() const = 0;

    virtual void registerRoutes(QHttpServer &server) = 0;
};

#endif // MEMTASK_HTTP_IROUTER_HPP
