#include <QtTest>
#include <QSignalSpy>
#include "ui/LogModel.hpp"

class TestLogModel : public QObject {
    Q_OBJECT
private slots:
    void testAppend();
    void testBoundDropsOldest();
    void testRoleNames();
    void testClear();
};

void TestLogModel::testAppend()
{
    pyro::LogModel model(10);
    QSignalSpy countSpy(&model, &pyro::LogModel::countChanged);
    QSignalSpy insertSpy(&model, &QAbstractItemModel::rowsInserted);

    model.append("Starting OpenVPN");
    model.append("TLS handshake initiated");

    QCOMPARE(model.rowCount(), 2);
    QCOMPARE(countSpy.count(), 2);
    QCOMPARE(insertSpy.count(), 2);
    QCOMPARE(model.data(model.index(1), pyro::LogModel::TextRole).toString(),
             QString("TLS handshake initiated"));
    QVERIFY(!model.data(model.index(5), pyro::LogModel::TextRole).isValid());
}

void TestLogModel::testBoundDropsOldest()
{
    pyro::LogModel model(3);
    QSignalSpy removeSpy(&model, &QAbstractItemModel::rowsRemoved);

    for (int i = 1; i <= 5; ++i)
        model.append(QString("line %1").arg(i));

    QCOMPARE(model.rowCount(), 3);
    QCOMPARE(removeSpy.count(), 2);
    QCOMPARE(model.lines(), QStringList({"line 3", "line 4", "line 5"}));
}

void TestLogModel::testRoleNames()
{
    pyro::LogModel model;
    QCOMPARE(model.maxLines(), 1000);
    QCOMPARE(model.roleNames().value(pyro::LogModel::TextRole), QByteArray("text"));
}

void TestLogModel::testClear()
{
    pyro::LogModel model(5);
    model.append("a");
    model.append("b");

    QSignalSpy countSpy(&model, &pyro::LogModel::countChanged);
    model.clear();
    QCOMPARE(model.rowCount(), 0);
    QCOMPARE(countSpy.count(), 1);

    model.clear();
    QCOMPARE(countSpy.count(), 1);
}

QTEST_MAIN(TestLogModel)
#include "test_log_model.moc"
