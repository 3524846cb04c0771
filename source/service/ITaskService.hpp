#ifndef MEMTASK_SERVICE_ITASKSERVICE_HPP
#define MEMTASK_SERVICE_ITASKSERVICE_HPP

#include <QUuid>
#include <optional>
#include <vector>

#include "Task.hpp"
#include "TaskInput.hpp"

enum class TaskError {
    None,
    NotFound,
    InvalidTitle,
    StorageFailure,
};

class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual std::vector<Task> getAllTasks() const = 0;
    virtual std::optional<Task> getTaskById(const QUuid &taskId) const = 0;

    // On failure the result is empty and *outError says why.
    virtual std::optional<Task> createTask(const TaskInput &input,
                                           TaskError *outError = nullptr) = 0;
    virtual std::optional<Task> updateTask(const QUuid &taskId,
                                           const TaskInput &input,
                                           TaskError *outError = nullptr) = 0;
    virtual bool deleteTask(const QUuid &taskId) = 0;
};

#endif // MEMTASK_SERVICE_ITASKSERVICE_HPP
