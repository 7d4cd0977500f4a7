#include <QTest>
#include "semantic/sse_parser.h"

class TestSseParser : public QObject {
    Q_OBJECT

private slots:
    void testSingleEvent() {
        SseParser parser;
        parser.feed("data: {\"choices\":[{\"delta\":{\"content\":\"Hello\"}}]}\n\n");

        auto event = parser.next();
        QVERIFY(event.has_value());
        QVERIFY(event->type.isEmpty());
        QCOMPARE(event->data, QByteArray("{\"choices\":[{\"delta\":{\"content\":\"Hello\"}}]}"));
        QVERIFY(!parser.next().has_value());
    }

    void testEventType() {
        SseParser parser;
        parser.feed("event: message_start\ndata: {\"type\":\"message_start\"}\n\n");

        auto event = parser.next();
        QVERIFY(event.has_value());
        QCOMPARE(event->type, QStringLiteral("message_start"));
        QCOMPARE(event->data, QByteArray("{\"type\":\"message_start\"}"));
    }

    void testSplitAcrossFeeds() {
        SseParser parser;
        parser.feed("data: {\"a\":");
        QVERIFY(!parser.next().has_value());
        parser.feed("1}\n");
        QVERIFY(!parser.next().has_value());
        parser.feed("\n");

        auto event = parser.next();
        QVERIFY(event.has_value());
        QCOMPARE(event->data, QByteArray("{\"a\":1}"));
    }

    void testCrlfDelimiters() {
        SseParser parser;
        parser.feed("event: ping\r\ndata: {}\r\n\r\ndata: [DONE]\r\n\r\n");

        auto first = parser.next();
        QVERIFY(first.has_value());
        QCOMPARE(first->type, QStringLiteral("ping"));
        QCOMPARE(first->data, QByteArray("{}"));

        auto second = parser.next();
        QVERIFY(second.has_value());
        QCOMPARE(second->data, QByteArray("[DONE]"));
    }

    void testMultiLineDataJoined() {
        SseParser parser;
        parser.feed("data: line one\ndata: line two\n\n");

        auto event = parser.next();
        QVERIFY(event.has_value());
        QCOMPARE(event->data, QByteArray("line one\nline two"));
    }

    void testCommentsAndFieldsIgnored() {
        SseParser parser;
        parser.feed(": keep-alive\n\nid: 7\nretry: 1000\ndata: ok\n\n");

        auto event = parser.next();
        QVERIFY(event.has_value());
        QCOMPARE(event->data, QByteArray("ok"));
        QVERIFY(!parser.next().has_value());
    }

    void testEventsComeOutOneAtATime() {
        SseParser parser;
        parser.feed("data: 1\n\ndata: 2\n\ndata: 3\n\n");

        QCOMPARE(parser.next()->data, QByteArray("1"));
        QVERIFY(parser.bufferedBytes() > 0);
        QCOMPARE(parser.next()->data, QByteArray("2"));
        QCOMPARE(parser.next()->data, QByteArray("3"));
        QVERIFY(!parser.next().has_value());
        QCOMPARE(parser.bufferedBytes(), 0);
    }

    void testFinishFlushesUnterminatedEvent() {
        SseParser parser;
        parser.feed("data: tail");
        QVERIFY(!parser.next().has_value());
        parser.finish();

        auto event = parser.next();
        QVERIFY(event.has_value());
        QCOMPARE(event->data, QByteArray("tail"));
    }

    void testDataWithoutSpace() {
        SseParser parser;
        parser.feed("data:{\"x\":true}\n\n");
        QCOMPARE(parser.next()->data, QByteArray("{\"x\":true}"));
    }
};

QTEST_MAIN(TestSseParser)
#include "tst_sse_parser.moc"
