#include "InMemoryStorage.hpp"

#include <QReadLocker>
#include <QWriteLocker>

#include "Logger.hpp"

namespace {

QString uuidToStr(const QUuid &id) { return id.toString(QUuid::WithoutBraces); }

} // END NAMESPACE

// Caller holds m_lock.
qsizetype InMemoryStorage::indexOf(const QUuid &id) const {
    for (qsizetype i = 0; i < m_tasks.size(); ++i) {
        if (m_tasks.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

std::vector<Task> InMemoryStorage::getAllTasks() const {
    QReadLocker locker(&m_lock);

    std::vector<Task> out(m_tasks.cbegin(), m_tasks.cend());
    qInfo(appStore) << "→" << out.size() << "tasks fetched";
    return out;
}

std::optional<Task> InMemoryStorage::getTaskById(const QUuid &id) const {
    QReadLocker locker(&m_lock);

    const qsizetype index = indexOf(id);
    if (index < 0) {
        qInfo(appStore) << "Task not found id=" << uuidToStr(id);
        return std::nullopt;
    }

    return m_tasks.at(index);
}

QUuid InMemoryStorage::addTask(const Task &task) {
    Task toStore = task;
    if (toStore.id.isNull()) {
        toStore.id = QUuid::createUuid();
    }

    QWriteLocker locker(&m_lock);

    if (indexOf(toStore.id) >= 0) {
        qWarning(appStore) << "Insert aborted: duplicate id="
                           << uuidToStr(toStore.id);
        return QUuid{};
    }

    m_tasks.append(toStore);
    qInfo(appStore) << "Task inserted id=" << uuidToStr(toStore.id)
                    << "title=" << toStore.title;
    return toStore.id;
}

bool InMemoryStorage::updateTask(const QUuid &id, const Task &task) {
    QWriteLocker locker(&m_lock);

    const qsizetype index = indexOf(id);
    if (index < 0) {
        qInfo(appStore) << "No task updated for id=" << uuidToStr(id);
        return false;
    }

    Task &stored = m_tasks[index];
    stored.title = task.title;
    stored.description = task.description;
    stored.isCompleted = task.isCompleted;

    qInfo(appStore) << "Task updated id=" << uuidToStr(id);
    return true;
}

bool InMemoryStorage::deleteTask(const QUuid &id) {
    QWriteLocker locker(&m_lock);

    const qsizetype index = indexOf(id);
    const bool ok = index >= 0;
    if (ok) {
        m_tasks.removeAt(index);
    }

    qInfo(appStore) << (ok ? "Deleted" : "Not found") << "id=" << uuidToStr(id);
    return ok;
}
