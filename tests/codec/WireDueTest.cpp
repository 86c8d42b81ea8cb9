#include <QtTest/QtTest>

#include "taskwire/codec/WireDue.hpp"

using namespace taskwire;

class WireDueTest : public QObject
{
    Q_OBJECT

private slots:
    void noDueWhenUnset();
    void datetimeWinsOverDate();
    void dateWhenNoDatetime();
    void stringWhenNoStructuredForm();
};

void WireDueTest::noDueWhenUnset()
{
    const codec::WireDue wire = codec::resolveWireDue(std::nullopt);
    QVERIFY(std::holds_alternative<codec::NoDue>(wire));
}

void WireDueTest::datetimeWinsOverDate()
{
    const auto due = data::Due::restore(QStringLiteral("tomorrow at 12"), QStringLiteral("2016-09-01"),
                                        QStringLiteral("2016-09-01T09:00:00Z"), QStringLiteral("Europe/Moscow"));
    const codec::WireDue wire = codec::resolveWireDue(due);
    QVERIFY(std::holds_alternative<codec::DueDateTime>(wire));
    QCOMPARE(std::get<codec::DueDateTime>(wire).datetime, QStringLiteral("2016-09-01T09:00:00Z"));
}

void WireDueTest::dateWhenNoDatetime()
{
    auto due = data::Due::create(QStringLiteral("tomorrow at noon"));
    due.setDate(QStringLiteral("2017-12-25"));
    const codec::WireDue wire = codec::resolveWireDue(due);
    QVERIFY(std::holds_alternative<codec::DueDate>(wire));
    QCOMPARE(std::get<codec::DueDate>(wire).date, QStringLiteral("2017-12-25"));
}

void WireDueTest::stringWhenNoStructuredForm()
{
    const codec::WireDue wire = codec::resolveWireDue(data::Due::create(QStringLiteral("every monday")));
    QVERIFY(std::holds_alternative<codec::DueString>(wire));
    QCOMPARE(std::get<codec::DueString>(wire).string, QStringLiteral("every monday"));
    QCOMPARE(std::get<codec::DueString>(wire).language, QStringLiteral("en"));
}

QTEST_GUILESS_MAIN(WireDueTest)
#include "WireDueTest.moc"
