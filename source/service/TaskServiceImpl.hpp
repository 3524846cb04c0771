#ifndef MEMTASK_SERVICE_TASKSERVICEIMPL_HPP
#define MEMTASK_SERVICE_TASKSERVICEIMPL_HPP

#include <QUuid>
#include <memory>
#include <optional>
#include <vector>

#include "IStorage.hpp"
#include "ITaskService.hpp"

class TaskServiceImpl : public ITaskService {
public:
    // requireTitleOnCreate applies the update-time title rule to create as
    // well. Off by default: create accepts an empty title.
    explicit TaskServiceImpl(std::shared_ptr<IStorage> storage,
                             bool requireTitleOnCreate = false);

    std::vector<Task> getAllTasks() const override;
    std::optional<Task> getTaskById(const QUuid &taskId) const override;

    std::optional<Task> createTask(const TaskInput &input,
                                   TaskError *outError = nullptr) override;
    std::optional<Task> updateTask(const QUuid &taskId, const TaskInput &input,
                                   TaskError *outError = nullptr) override;
    bool deleteTask(const QUuid &taskId) override;

private:
    std::shared_ptr<IStorage> m_storage;
    bool m_requireTitleOnCreate;
};

#endif // MEMTASK_SERVICE_TASKSERVICEIMPL_HPP
