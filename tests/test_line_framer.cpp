#include <QtTest/QtTest>
#include "core/vpn/LineFramer.hpp"

class TestLineFramer : public QObject {
    Q_OBJECT

private:
    static QByteArray sampleStream()
    {
        return QByteArray(">INFO:OpenVPN Management Interface Version 5\r\n"
                          ">STATE:1700000000,CONNECTING,,,,,,\r\n"
                          ">LOG:1700000001,I,TLS: Initial packet from [AF_INET]203.0.113.5:1194\r\n"
                          ">PASSWORD:Need 'Auth' username/password\r\n"
                          ">STATE:1700000002,CONNECTED,SUCCESS,10.8.0.6,203.0.113.5,1194,,\n");
    }

    static QList<QByteArray> expectedLines()
    {
        return {
            ">INFO:OpenVPN Management Interface Version 5",
            ">STATE:1700000000,CONNECTING,,,,,,",
            ">LOG:1700000001,I,TLS: Initial packet from [AF_INET]203.0.113.5:1194",
            ">PASSWORD:Need 'Auth' username/password",
            ">STATE:1700000002,CONNECTED,SUCCESS,10.8.0.6,203.0.113.5,1194,,",
        };
    }

private slots:
    void testSingleChunk()
    {
        pyro::LineFramer framer;
        QCOMPARE(framer.feed(sampleStream()), expectedLines());
        QVERIFY(framer.pending().isEmpty());
    }

    void testByteByByte()
    {
        pyro::LineFramer framer;
        const QByteArray stream = sampleStream();
        QList<QByteArray> lines;
        for (int i = 0; i < stream.size(); ++i)
            lines += framer.feed(stream.mid(i, 1));
        QCOMPARE(lines, expectedLines());
    }

    void testEverySplitPoint()
    {
        const QByteArray stream = sampleStream();
        for (int split = 0; split <= stream.size(); ++split) {
            pyro::LineFramer framer;
            QList<QByteArray> lines = framer.feed(stream.left(split));
            lines += framer.feed(stream.mid(split));
            QCOMPARE(lines, expectedLines());
        }
    }

    void testCarriageReturnSplitFromNewline()
    {
        pyro::LineFramer framer;
        QVERIFY(framer.feed("hold release\r").isEmpty());
        QCOMPARE(framer.pending(), QByteArray("hold release\r"));
        const auto lines = framer.feed("\n");
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines[0], QByteArray("hold release"));
    }

    void testPartialTailKept()
    {
        pyro::LineFramer framer;
        const auto lines = framer.feed("first\nsec");
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines[0], QByteArray("first"));
        QCOMPARE(framer.pending(), QByteArray("sec"));

        const auto rest = framer.feed("ond\n");
        QCOMPARE(rest.size(), 1);
        QCOMPARE(rest[0], QByteArray("second"));
        QVERIFY(framer.pending().isEmpty());
    }

    void testEmptyLinesPreserved()
    {
        pyro::LineFramer framer;
        const auto lines = framer.feed("a\n\nb\n");
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines[1], QByteArray());
    }

    void testClearDropsPartialLine()
    {
        pyro::LineFramer framer;
        framer.feed(">STATE:17000");
        framer.clear();
        const auto lines = framer.feed("00000,WAIT,,,\n");
        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines[0], QByteArray("00000,WAIT,,,"));
    }
};

QTEST_MAIN(TestLineFramer)
#include "test_line_framer.moc"
