#ifndef MEMTASK_STORAGE_ISTORAGE_HPP
#define MEMTASK_STORAGE_ISTORAGE_HPP

#include <QUuid>
#include <optional>
#include <vector>

#include "Task.hpp"

class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::vector<Task> getAllTasks() const = 0;
    virtual std::optional<Task> getTaskById(const QUuid &id) const = 0;

    // Returns the stored id, or a null QUuid when the task was rejected.
    virtual QUuid addTask(const Task &task) = 0;
    virtual bool updateTask(const QUuid &id, const Task &task) = 0;
    virtual bool deleteTask(const QUuid &id) = 0;
};

#endif // MEMTASK_STORAGE_ISTORAGE_HPP
