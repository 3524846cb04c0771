#ifndef MEMTASK_UTILS_JSONUTILS_HPP
#define MEMTASK_UTILS_JSONUTILS_HPP

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtHttpServer/QHttpServerResponse>
#include <optional>

inline QHttpServerResponse makeJson(const QJsonObject &obj,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(obj).toJson(QJsonDocument::Compact),
        status);
}

inline QHttpServerResponse
makeJsonArray(const QJsonArray &arr, QHttpServerResponse::StatusCode status =
                                     QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(arr).toJson(QJsonDocument::Compact),
        status);
}

inline QHttpServerResponse makeText(const QString &message,
                                    QHttpServerResponse::StatusCode status) {
    return QHttpServerResponse("text/plain", message.toUtf8(), status);
}

// No body: 204, and 404 for an unknown id or route.
inline QHttpServerResponse makeEmpty(QHttpServerResponse::StatusCode status) {
    return QHttpServerResponse(status);
}

inline std::optional<QJsonObject> parseBodyObject(const QByteArray &body,
                                                  QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        if (outError) {
            *outError = parseError.errorString();
        }
        return std::nullopt;
    }

    if (!doc.isObject()) {
        if (outError) {
            *outError = QStringLiteral("expected a JSON object");
        }
        return std::nullopt;
    }

    return doc.object();
}

#endif // MEMTASK_UTILS_JSONUTILS_HPP
