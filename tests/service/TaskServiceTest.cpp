#include <QtTest/QtTest>

#include <QSet>
#include <memory>

#include "InMemoryStorage.hpp"
#include "TaskServiceImpl.hpp"

namespace {

// Drops the task between the service's lookup and its write, which is what
// a DELETE racing an UPDATE on the same id looks like from the service.
class VanishingStorage : public InMemoryStorage {
public:
    bool updateTask(const QUuid &id, const Task &task) override {
        InMemoryStorage::deleteTask(id);
        return InMemoryStorage::updateTask(id, task);
    }
};

} // namespace

class TaskServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void createAssignsFreshUniqueIds();
    void createAllowsEmptyTitleByDefault();
    void createRejectsEmptyTitleWhenStrict();
    void getAfterCreateReturnsEqualTask();
    void updateReplacesFieldsKeepsId();
    void updateWithBlankTitleLeavesTaskUntouched_data();
    void updateWithBlankTitleLeavesTaskUntouched();
    void updateUnknownIdIsNotFound();
    void updateOfTaskDeletedMidwayIsNotFound();
    void notFoundWinsOverInvalidTitle();
    void deleteThenGetIsNotFound();
    void listReflectsCreatesAndDeletes();

private:
    static TaskInput input(const QString &title, bool done = false,
                           std::optional<QString> description = std::nullopt);

    std::shared_ptr<InMemoryStorage> m_storage;
    std::unique_ptr<TaskServiceImpl> m_service;
};

TaskInput TaskServiceTest::input(const QString &title, bool done,
                                 std::optional<QString> description)
{
    TaskInput in;
    in.title = title;
    in.isCompleted = done;
    in.description = std::move(description);
    return in;
}

void TaskServiceTest::init()
{
    m_storage = std::make_shared<InMemoryStorage>();
    m_service = std::make_unique<TaskServiceImpl>(m_storage);
}

void TaskServiceTest::createAssignsFreshUniqueIds()
{
    QSet<QUuid> seen;
    for (int i = 0; i < 20; ++i) {
        const auto created = m_service->createTask(input(QStringLiteral("task %1").arg(i)));
        QVERIFY(created.has_value());
        QVERIFY(!created->id.isNull());
        QVERIFY(!seen.contains(created->id));
        seen.insert(created->id);
    }
}

void TaskServiceTest::createAllowsEmptyTitleByDefault()
{
    TaskError error = TaskError::StorageFailure;
    const auto created = m_service->createTask(input(QString()), &error);

    QVERIFY(created.has_value());
    QCOMPARE(error, TaskError::None);
    QVERIFY(created->title.isEmpty());
    QVERIFY(m_service->getTaskById(created->id).has_value());
}

void TaskServiceTest::createRejectsEmptyTitleWhenStrict()
{
    TaskServiceImpl strict(m_storage, true);

    TaskError error = TaskError::None;
    QVERIFY(!strict.createTask(input(QStringLiteral("  ")), &error).has_value());
    QCOMPARE(error, TaskError::InvalidTitle);
    QVERIFY(strict.getAllTasks().empty());

    QVERIFY(strict.createTask(input(QStringLiteral("ok"))).has_value());
}

void TaskServiceTest::getAfterCreateReturnsEqualTask()
{
    const auto created = m_service->createTask(
        input(QStringLiteral("Buy groceries"), false, QStringLiteral("Milk, Bread, Eggs")));
    QVERIFY(created.has_value());

    const auto fetched = m_service->getTaskById(created->id);
    QVERIFY(fetched.has_value());
    QVERIFY(*fetched == *created);
}

void TaskServiceTest::updateReplacesFieldsKeepsId()
{
    const auto created = m_service->createTask(
        input(QStringLiteral("Buy groceries"), false, QStringLiteral("Milk, Bread, Eggs")));
    QVERIFY(created.has_value());

    TaskError error = TaskError::StorageFailure;
    const auto updated = m_service->updateTask(
        created->id, input(QStringLiteral("Buy milk"), true), &error);

    QVERIFY(updated.has_value());
    QCOMPARE(error, TaskError::None);
    QCOMPARE(updated->id, created->id);
    QCOMPARE(updated->title, QStringLiteral("Buy milk"));
    QCOMPARE(updated->isCompleted, true);
    QVERIFY(!updated->description.has_value());
    QVERIFY(*m_service->getTaskById(created->id) == *updated);
}

void TaskServiceTest::updateWithBlankTitleLeavesTaskUntouched_data()
{
    QTest::addColumn<QString>("title");

    QTest::newRow("empty") << QString();
    QTest::newRow("spaces") << QStringLiteral("   ");
    QTest::newRow("tab") << QStringLiteral("\t");
    QTest::newRow("mixed whitespace") << QStringLiteral(" \t\r\n ");
}

void TaskServiceTest::updateWithBlankTitleLeavesTaskUntouched()
{
    QFETCH(QString, title);

    const auto created = m_service->createTask(input(QStringLiteral("Keep me")));
    QVERIFY(created.has_value());
    const auto before = m_service->getTaskById(created->id);

    TaskError error = TaskError::None;
    QVERIFY(!m_service->updateTask(created->id, input(title, true), &error).has_value());
    QCOMPARE(error, TaskError::InvalidTitle);

    const auto after = m_service->getTaskById(created->id);
    QVERIFY(after.has_value());
    QVERIFY(*after == *before);
}

void TaskServiceTest::updateUnknownIdIsNotFound()
{
    TaskError error = TaskError::None;
    QVERIFY(!m_service->updateTask(QUuid::createUuid(), input(QStringLiteral("x")), &error)
                 .has_value());
    QCOMPARE(error, TaskError::NotFound);
}

void TaskServiceTest::updateOfTaskDeletedMidwayIsNotFound()
{
    TaskServiceImpl service(std::make_shared<VanishingStorage>());
    const auto created = service.createTask(input(QStringLiteral("racing")));
    QVERIFY(created.has_value());

    TaskError error = TaskError::None;
    QVERIFY(!service.updateTask(created->id, input(QStringLiteral("new")), &error)
                 .has_value());
    QCOMPARE(error, TaskError::NotFound);
    QVERIFY(!service.getTaskById(created->id).has_value());
}

void TaskServiceTest::notFoundWinsOverInvalidTitle()
{
    TaskError error = TaskError::None;
    QVERIFY(!m_service->updateTask(QUuid::createUuid(), input(QString()), &error).has_value());
    QCOMPARE(error, TaskError::NotFound);
}

void TaskServiceTest::deleteThenGetIsNotFound()
{
    const auto created = m_service->createTask(input(QStringLiteral("Temporary")));
    QVERIFY(created.has_value());

    QVERIFY(m_service->deleteTask(created->id));
    QVERIFY(!m_service->getTaskById(created->id).has_value());
    QVERIFY(!m_service->deleteTask(created->id));
}

void TaskServiceTest::listReflectsCreatesAndDeletes()
{
    QVERIFY(m_service->getAllTasks().empty());

    std::vector<Task> created;
    for (int i = 0; i < 5; ++i) {
        created.push_back(*m_service->createTask(input(QStringLiteral("t%1").arg(i))));
    }
    QVERIFY(m_service->deleteTask(created[1].id));
    QVERIFY(m_service->deleteTask(created[3].id));

    const auto all = m_service->getAllTasks();
    QCOMPARE(all.size(), size_t(3));
    for (const Task &task : all) {
        QVERIFY(task.id != created[1].id);
        QVERIFY(task.id != created[3].id);
        QVERIFY(m_service->getTaskById(task.id).has_value());
    }
}

QTEST_GUILESS_MAIN(TaskServiceTest)
#include "TaskServiceTest.moc"
