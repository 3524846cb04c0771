#ifndef MEMTASK_UTILS_ERRORHANDLER_HPP
#define MEMTASK_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QtNetwork/QHttpHeaders>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>
#include <exception>
#include <functional>
#include <utility>

#include "JsonUtils.hpp"
#include "Logger.hpp"

inline constexpr const char *kRequestIdHeader = "X-Request-Id";

inline QHttpServerResponse withHeader(QHttpServerResponse response,
                                      QAnyStringView name,
                                      QAnyStringView value) {
    QHttpHeaders headers = response.headers();
    if (!headers.append(name, value)) {
        qWarning(appHttp) << "Rejected response header" << name.toString();
    }
    response.setHeaders(std::move(headers));
    return response;
}

namespace detail {

// Times the handler, logs the outcome and tags the response with the
// request id. Anything the handler throws becomes a 500.
template <typename Invoke>
QHttpServerResponse runSafe(const char *routeName, Invoke invoke) {
    const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const qint64 started = QDateTime::currentMSecsSinceEpoch();
    try {
        QHttpServerResponse resp = invoke(requestId);
        qInfo(appHttp) << "[DONE]" << routeName
                       << "| status=" << static_cast<int>(resp.statusCode())
                       << "| requestId=" << requestId
                       << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
        return withHeader(std::move(resp), kRequestIdHeader, requestId);
    } catch (const std::exception &e) {
        qCritical(appHttp) << "[EXC]" << routeName
                           << "| requestId=" << requestId
                           << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                           << "| what=" << e.what();
        return withHeader(makeText(QStringLiteral("Internal error"),
                                   QHttpServerResponse::StatusCode::InternalServerError),
                          kRequestIdHeader, requestId);
    } catch (...) {
        qCritical(appHttp) << "[EXC]" << routeName
                           << "| requestId=" << requestId
                           << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started)
                           << "| unknown exception";
        return withHeader(makeText(QStringLiteral("Internal error"),
                                   QHttpServerResponse::StatusCode::InternalServerError),
                          kRequestIdHeader, requestId);
    }
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Safe wrapper overloads with fixed signatures
// ─────────────────────────────────────────────────────────────────────────────

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &requestId)> fn) {
    return [routeName, fn]() -> QHttpServerResponse {
        return detail::runSafe(routeName, [&](const QString &requestId) {
            return fn(requestId);
        });
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QHttpServerRequest &request) -> QHttpServerResponse {
        return detail::runSafe(routeName, [&](const QString &requestId) {
            return fn(request, requestId);
        });
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &pathArg,
                                                       const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QString &pathArg,
                           const QHttpServerRequest &request) -> QHttpServerResponse {
        return detail::runSafe(routeName, [&](const QString &requestId) {
            return fn(pathArg, request, requestId);
        });
    };
}

inline void sendNotFound(QHttpServerResponder &responder,
                         const QHttpServerRequest &request) {
    qWarning(appHttp) << "404 no route for" << toString(request.method())
                      << request.url().toString();
    responder.sendResponse(makeEmpty(QHttpServerResponse::StatusCode::NotFound));
}

#endif // MEMTASK_UTILS_ERRORHANDLER_HPP
