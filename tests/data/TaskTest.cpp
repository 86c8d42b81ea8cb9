#include <QtTest/QtTest>

#include "taskwire/data/Task.hpp"

using namespace taskwire::data;

class TaskTest : public QObject
{
    Q_OBJECT

private slots:
    void createUsesDefaults();
    void updateProperties();
    void labelIdsKeepOrder();
    void removeLabelIdDropsEveryOccurrence();
    void setPriorityAcceptsRange();
    void setPriorityRejectsOutOfRange_data();
    void setPriorityRejectsOutOfRange();
    void setAndClearDue();
};

void TaskTest::createUsesDefaults()
{
    const Task task = Task::create(QStringLiteral("Test Task"));

    QCOMPARE(task.content(), QStringLiteral("Test Task"));
    QCOMPARE(task.priority(), 1);
    QCOMPARE(task.completed(), false);
    QVERIFY(task.labelIds().isEmpty());
    QVERIFY(!task.id().has_value());
    QVERIFY(!task.projectId().has_value());
    QVERIFY(!task.order().has_value());
    QVERIFY(!task.indent().has_value());
    QVERIFY(!task.due().has_value());
    QVERIFY(!task.url().has_value());
    QVERIFY(!task.commentCount().has_value());
}

void TaskTest::updateProperties()
{
    Task task = Task::create(QStringLiteral("Test Task"));
    task.setContent(QStringLiteral("New Task Name"));
    task.setCompleted(true);
    task.setProjectId(qint64(2345));

    QCOMPARE(task.content(), QStringLiteral("New Task Name"));
    QVERIFY(task.completed());
    QCOMPARE(*task.projectId(), qint64(2345));

    task.setProjectId(std::nullopt);
    QVERIFY(!task.projectId().has_value());
}

void TaskTest::labelIdsKeepOrder()
{
    Task task = Task::create(QStringLiteral("Test Task"));
    task.addLabelId(10);
    task.addLabelId(4);
    task.addLabelId(1);
    task.addLabelId(4);

    QCOMPARE(task.labelIds(), (QVector<qint64>{ 10, 4, 1, 4 }));
    QVERIFY(task.hasLabelId(1));
    QVERIFY(!task.hasLabelId(7));
}

void TaskTest::removeLabelIdDropsEveryOccurrence()
{
    Task task = Task::create(QStringLiteral("Test Task"));
    task.addLabelId(10);
    task.addLabelId(4);
    task.addLabelId(1);
    task.removeLabelId(4);
    QCOMPARE(task.labelIds(), (QVector<qint64>{ 10, 1 }));

    task.addLabelId(10);
    task.removeLabelId(10);
    QCOMPARE(task.labelIds(), (QVector<qint64>{ 1 }));

    task.removeLabelId(99);
    QCOMPARE(task.labelIds(), (QVector<qint64>{ 1 }));
}

void TaskTest::setPriorityAcceptsRange()
{
    Task task = Task::create(QStringLiteral("Test Task"));
    for (int priority = 1; priority <= 4; ++priority) {
        ValidationError error;
        QVERIFY(task.setPriority(priority, &error));
        QCOMPARE(task.priority(), priority);
        QCOMPARE(error.code, ValidationError::NoError);
    }
}

void TaskTest::setPriorityRejectsOutOfRange_data()
{
    QTest::addColumn<int>("priority");
    QTest::newRow("zero") << 0;
    QTest::newRow("five") << 5;
    QTest::newRow("negative") << -1;
}

void TaskTest::setPriorityRejectsOutOfRange()
{
    QFETCH(int, priority);

    Task task = Task::create(QStringLiteral("Test Task"));
    QVERIFY(task.setPriority(3));

    ValidationError error;
    QVERIFY(!task.setPriority(priority, &error));
    QCOMPARE(error.code, ValidationError::PriorityOutOfRange);
    QCOMPARE(error.field, QStringLiteral("priority"));
    QVERIFY(error.errorString().startsWith(QStringLiteral("priority: ")));
    QCOMPARE(task.priority(), 3);

    QVERIFY(!task.setPriority(priority));
    QCOMPARE(task.priority(), 3);

    QVERIFY(task.setPriority(2, &error));
    QCOMPARE(error.code, ValidationError::NoError);
    QVERIFY(error.field.isEmpty());
}

void TaskTest::setAndClearDue()
{
    Due due = Due::create(QStringLiteral("tomorrow at noon"));
    due.setDate(QStringLiteral("2017-12-25"));

    Task task = Task::create(QStringLiteral("Test Task"));
    task.setDue(due);
    QVERIFY(task.due().has_value());
    QCOMPARE(*task.due()->date(), QStringLiteral("2017-12-25"));

    task.setDue(std::nullopt);
    QVERIFY(!task.due().has_value());
}

QTEST_GUILESS_MAIN(TaskTest)
#include "TaskTest.moc"
