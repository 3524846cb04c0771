#ifndef MEMTASK_MODEL_TASKINPUT_HPP
#define MEMTASK_MODEL_TASKINPUT_HPP

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

#include "Task.hpp"

// Request body for create and update. Binding is strict about JSON types
// and lenient about presence: a missing member takes its default. Member
// names match case-insensitively.
//  - "title": string | null         (default "")
//  - "description": string | null   (default none)
//  - "isCompleted": bool            (default false)
//  - "id" and unknown keys are ignored
struct TaskInput {
    QString title;
    std::optional<QString> description;
    bool isCompleted = false;

    bool hasValidTitle() const { return !title.trimmed().isEmpty(); }

    void applyTo(Task &task) const {
        task.title = title;
        task.description = description;
        task.isCompleted = isCompleted;
    }

    static std::optional<TaskInput> fromJson(const QJsonObject &jsonObject,
                                             QString *outError = nullptr) {
        const auto fail = [outError](const char *field, const char *expected) {
            if (outError) {
                *outError = QStringLiteral("field '%1' must be %2")
                                .arg(QLatin1String(field), QLatin1String(expected));
            }
            return std::nullopt;
        };

        TaskInput input;

        const QJsonValue title = member(jsonObject, QLatin1String("title"));
        if (title.isString()) {
            input.title = title.toString();
        } else if (!title.isUndefined() && !title.isNull()) {
            return fail("title", "a string");
        }

        const QJsonValue description = member(jsonObject, QLatin1String("description"));
        if (description.isString()) {
            input.description = description.toString();
        } else if (!description.isUndefined() && !description.isNull()) {
            return fail("description", "a string or null");
        }

        const QJsonValue isCompleted = member(jsonObject, QLatin1String("isCompleted"));
        if (isCompleted.isBool()) {
            input.isCompleted = isCompleted.toBool();
        } else if (!isCompleted.isUndefined()) {
            return fail("isCompleted", "a boolean");
        }

        return input;
    }

private:
    // Exact key first, then the first key equal to `name` ignoring case.
    static QJsonValue member(const QJsonObject &jsonObject, QLatin1String name) {
        const auto exact = jsonObject.constFind(name);
        if (exact != jsonObject.constEnd()) {
            return exact.value();
        }
        for (auto it = jsonObject.constBegin(); it != jsonObject.constEnd(); ++it) {
            if (it.key().compare(name, Qt::CaseInsensitive) == 0) {
                return it.value();
            }
        }
        return QJsonValue(QJsonValue::Undefined);
    }
};

#endif // MEMTASK_MODEL_TASKINPUT_HPP
