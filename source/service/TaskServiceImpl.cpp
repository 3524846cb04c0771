#include "Logger.hpp"
#include "TaskServiceImpl.hpp"

namespace {

std::optional<Task> fail(TaskError *outError, TaskError error) {
    if (outError) {
        *outError = error;
    }
    return std::nullopt;
}

} // END NAMESPACE

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<IStorage> storage,
                                 bool requireTitleOnCreate)
    : m_storage(std::move(storage)),
      m_requireTitleOnCreate(requireTitleOnCreate) {}

// ───────────────────────────────────────────────
// Tasks
// ───────────────────────────────────────────────

std::vector<Task> TaskServiceImpl::getAllTasks() const {
    auto tasks = m_storage->getAllTasks();
    qInfo(appCore) << "[Server] Retrieved" << tasks.size() << "tasks";
    return tasks;
}

std::optional<Task> TaskServiceImpl::getTaskById(const QUuid &taskId) const {
    if (taskId.isNull()) {
        qWarning(appCore) << "[Server] getTaskById called with null id";
        return std::nullopt;
    }
    auto task = m_storage->getTaskById(taskId);
    if (task) {
        qInfo(appCore) << "[Server] Task found:" << task->title;
    } else {
        qWarning(appCore) << "[Server] Task with id" << taskId.toString()
                          << "not found";
    }
    return task;
}

std::optional<Task> TaskServiceImpl::createTask(const TaskInput &input,
                                                TaskError *outError) {
    if (m_requireTitleOnCreate && !input.hasValidTitle()) {
        qWarning(appCore) << "[Server] Attempt to add task with empty title";
        return fail(outError, TaskError::InvalidTitle);
    }

    Task task;
    task.id = QUuid::createUuid();
    input.applyTo(task);

    const QUuid storedId = m_storage->addTask(task);
    if (storedId.isNull()) {
        qCritical(appCore) << "[Server] Failed to add task:" << task.title;
        return fail(outError, TaskError::StorageFailure);
    }
    task.id = storedId;

    qInfo(appCore) << "[Server] Task added:" << task.title
                   << "(id=" << storedId.toString() << ")";
    if (outError) {
        *outError = TaskError::None;
    }
    return task;
}

std::optional<Task> TaskServiceImpl::updateTask(const QUuid &taskId,
                                                const TaskInput &input,
                                                TaskError *outError) {
    const auto current = taskId.isNull() ? std::nullopt
                                         : m_storage->getTaskById(taskId);
    if (!current) {
        qWarning(appCore) << "[Server] Attempt to update missing task (id="
                          << taskId.toString() << ")";
        return fail(outError, TaskError::NotFound);
    }

    if (!input.hasValidTitle()) {
        qWarning(appCore) << "[Server] Rejected update with empty title (id="
                          << taskId.toString() << ")";
        return fail(outError, TaskError::InvalidTitle);
    }

    Task toSave = *current;
    input.applyTo(toSave);

    // The task may have been deleted since the lookup above.
    if (!m_storage->updateTask(taskId, toSave)) {
        qWarning(appCore) << "[Server] Task vanished during update (id="
                          << taskId.toString() << ")";
        return fail(outError, TaskError::NotFound);
    }

    qInfo(appCore) << "[Server] Task updated:" << toSave.title
                   << "(id=" << taskId.toString() << ")";
    if (outError) {
        *outError = TaskError::None;
    }
    return toSave;
}

bool TaskServiceImpl::deleteTask(const QUuid &taskId) {
    if (taskId.isNull()) {
        qWarning(appCore) << "[Server] Attempt to delete task with null id";
        return false;
    }

    const bool ok = m_storage->deleteTask(taskId);
    if (ok) {
        qInfo(appCore) << "[Server] Task deleted (id=" << taskId.toString()
                       << ")";
    } else {
        qWarning(appCore) << "[Server] No task to delete (id="
                          << taskId.toString() << ")";
    }

    return ok;
}
