#ifndef MEMTASK_MODEL_TASK_HPP
#define MEMTASK_MODEL_TASK_HPP

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QUuid>
#include <optional>

struct Task {
    QUuid id;
    QString title;
    std::optional<QString> description;
    bool isCompleted = false;

    QJsonObject toJson() const {
        return QJsonObject{{"id", id.toString(QUuid::WithoutBraces)},
                           {"title", title},
                           {"description", description
                                               ? QJsonValue(*description)
                                               : QJsonValue(QJsonValue::Null)},
                           {"isCompleted", isCompleted}};
    }

    bool operator==(const Task &other) const {
        return id == other.id && title == other.title &&
               description == other.description &&
               isCompleted == other.isCompleted;
    }
};

#endif // MEMTASK_MODEL_TASK_HPP
