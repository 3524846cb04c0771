#ifndef MEMTASK_STORAGE_INMEMORYSTORAGE_HPP
#define MEMTASK_STORAGE_INMEMORYSTORAGE_HPP

#include <QReadWriteLock>
#include <QVector>

#include "IStorage.hpp"

// Process-lifetime task store. Keeps insertion order; lookups are a linear
// scan. Readers share the lock, mutations take it exclusively.
class InMemoryStorage : public IStorage {
public:
    InMemoryStorage() = default;

    std::vector<Task> getAllTasks() const override;
    std::optional<Task> getTaskById(const QUuid &id) const override;

    QUuid addTask(const Task &task) override;
    bool updateTask(const QUuid &id, const Task &task) override;
    bool deleteTask(const QUuid &id) override;

private:
    qsizetype indexOf(const QUuid &id) const;

    mutable QReadWriteLock m_lock;
    QVector<Task> m_tasks;
};

#endif // MEMTASK_STORAGE_INMEMORYSTORAGE_HPP
