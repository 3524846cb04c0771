#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonObject>

#include "DocsRouter.hpp"
#include "OpenApiDocument.hpp"
#include "TaskRouter.hpp"

class OpenApiDocumentTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void describesVersionAndTag();
    void pathsCoverEveryRoute();
    void itemOperationsDeclareIdParameter();
    void taskSchemaMarksTitleRequired();
    void listResponseCarriesBothExamples();
    void docsRouterServesSameDocument();

private:
    QJsonObject m_doc;
};

void OpenApiDocumentTest::initTestCase()
{
    m_doc = buildOpenApiDocument(TaskRouter::routes());
}

void OpenApiDocumentTest::describesVersionAndTag()
{
    QCOMPARE(m_doc.value("openapi").toString(), QStringLiteral("3.0.1"));
    QCOMPARE(m_doc.value("info").toObject().value("version").toString(), QStringLiteral("v1"));
    QCOMPARE(m_doc.value("tags").toArray().first().toObject().value("name").toString(),
             QStringLiteral("Tasks API"));
}

void OpenApiDocumentTest::pathsCoverEveryRoute()
{
    const QJsonObject paths = m_doc.value("paths").toObject();
    QCOMPARE(paths.size(), qsizetype(2));

    const QJsonObject collection = paths.value("/api/v1/tasks/").toObject();
    QVERIFY(collection.contains("get"));
    QVERIFY(collection.contains("post"));
    QVERIFY(collection.value("post").toObject().contains("requestBody"));
    QVERIFY(collection.value("post").toObject().value("responses").toObject().contains("201"));

    const QJsonObject item = paths.value("/api/v1/tasks/{id}").toObject();
    QVERIFY(item.contains("get"));
    QVERIFY(item.contains("put"));
    QVERIFY(item.contains("delete"));

    const QJsonObject putResponses = item.value("put").toObject().value("responses").toObject();
    QVERIFY(putResponses.contains("200"));
    QVERIFY(putResponses.contains("400"));
    QVERIFY(putResponses.contains("404"));

    const QJsonObject deleted =
        item.value("delete").toObject().value("responses").toObject().value("204").toObject();
    QCOMPARE(deleted.value("description").toString(), QStringLiteral("Task deleted"));
    QVERIFY(!deleted.contains("content"));
}

void OpenApiDocumentTest::itemOperationsDeclareIdParameter()
{
    const QJsonObject get = m_doc.value("paths").toObject()
                                .value("/api/v1/tasks/{id}").toObject()
                                .value("get").toObject();
    const QJsonObject param = get.value("parameters").toArray().first().toObject();

    QCOMPARE(param.value("name").toString(), QStringLiteral("id"));
    QCOMPARE(param.value("in").toString(), QStringLiteral("path"));
    QCOMPARE(param.value("description").toString(), QStringLiteral("Unique task ID (GUID)"));
}

void OpenApiDocumentTest::taskSchemaMarksTitleRequired()
{
    const QJsonObject schema = m_doc.value("components").toObject()
                                   .value("schemas").toObject()
                                   .value("Task").toObject();

    QCOMPARE(schema.value("required").toArray(), QJsonArray{"title"});
    const QJsonObject properties = schema.value("properties").toObject();
    QCOMPARE(properties.keys(),
             (QStringList{"description", "id", "isCompleted", "title"}));
    QVERIFY(properties.value("description").toObject().value("nullable").toBool());
}

void OpenApiDocumentTest::listResponseCarriesBothExamples()
{
    const QJsonArray examples = m_doc.value("paths").toObject()
                                    .value("/api/v1/tasks/").toObject()
                                    .value("get").toObject()
                                    .value("responses").toObject()
                                    .value("200").toObject()
                                    .value("content").toObject()
                                    .value("application/json").toObject()
                                    .value("example").toArray();

    QCOMPARE(examples.size(), qsizetype(2));
    QCOMPARE(examples.at(0).toObject().value("title").toString(), QStringLiteral("Buy groceries"));
    QCOMPARE(examples.at(1).toObject().value("isCompleted").toBool(), true);
}

void OpenApiDocumentTest::docsRouterServesSameDocument()
{
    const DocsRouter docs(TaskRouter::routes());
    QCOMPARE(docs.document(), m_doc);
    QCOMPARE(QString::fromLatin1(docs.name()), QStringLiteral("docs"));
}

QTEST_GUILESS_MAIN(OpenApiDocumentTest)
#include "OpenApiDocumentTest.moc"
