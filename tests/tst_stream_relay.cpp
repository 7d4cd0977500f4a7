#include <QTest>
#include <QTcpServer>
#include <QTcpSocket>
#include <QPointer>
#include "proxy/stream_relay.h"
#include "proxy/sse_writer.h"
#include "pipeline/pipeline.h"
#include "semantic/stream_session.h"
#include "adapters/inbound/openai_chat.h"
#include "adapters/outbound/openai.h"
#include "fake_reply.h"

namespace {

// A connected loopback pair: the relay writes on server(), the test reads
// what a caller would see on client().
class SocketPair {
public:
    // A client that never reads keeps at most a few bytes in its buffer.
    bool open(bool reading = true) {
        if (!m_listener.listen(QHostAddress::LocalHost))
            return false;
        m_client.connectToHost(QHostAddress::LocalHost, m_listener.serverPort());
        if (!m_client.waitForConnected(2000))
            return false;
        if (!m_listener.hasPendingConnections() && !m_listener.waitForNewConnection(2000))
            return false;
        m_server = m_listener.nextPendingConnection();
        if (!reading)
            m_client.setReadBufferSize(1024);
        else
            QObject::connect(&m_client, &QTcpSocket::readyRead, &m_client,
                             [this]() { received += m_client.readAll(); });
        QObject::connect(&m_client, &QTcpSocket::disconnected, &m_client,
                         [this]() { clientClosed = true; });
        return m_server != nullptr;
    }

    QTcpSocket* server() const { return m_server; }
    QTcpSocket& client() { return m_client; }

    QByteArray received;
    bool clientClosed = false;

private:
    QTcpServer m_listener;
    QTcpSocket m_client;
    QTcpSocket* m_server = nullptr;
};

QList<StreamFrame> textFrames(const QString& text) {
    StreamFrame started;
    started.type = FrameType::Started;
    started.responseId = QStringLiteral("chatcmpl-relay");
    started.model = QStringLiteral("gpt-4o");

    StreamFrame delta;
    delta.type = FrameType::Delta;
    delta.deltaSegments.append(Segment::fromText(text));

    StreamFrame done;
    done.type = FrameType::Finished;
    done.stopCause = StopCause::Completed;
    done.isFinal = true;
    return {started, delta, done};
}

struct RelayOutcome {
    bool finished = false;
    bool keepAlive = false;

    void attach(StreamRelay* relay) {
        QObject::connect(relay, &StreamRelay::finished, relay, [this](bool keep) {
            finished = true;
            keepAlive = keep;
        });
    }
};

}

class TestStreamRelay : public QObject {
    Q_OBJECT

private slots:
    void testToSseEvent() {
        QCOMPARE(SseWriter::toSseEvent("{\"a\":1}"), QByteArray("data: {\"a\":1}\n\n"));
        const QByteArray framed = "event: ping\ndata: {}\n\n";
        QCOMPARE(SseWriter::toSseEvent(framed), framed);
    }

    void testWrapChunked() {
        QCOMPARE(SseWriter::wrapChunked("hello"), QByteArray("5\r\nhello\r\n"));
        QCOMPARE(SseWriter::wrapChunked(QByteArray(26, 'x')).left(4), QByteArray("1a\r\n"));
    }

    void testCompleteStreamKeepsConnection() {
        SocketPair pair;
        QVERIFY(pair.open());

        OpenAIChatAdapter inbound;
        auto* session = new PipelineStreamSession(textFrames(QStringLiteral("Hi there")), &inbound,
                                                  QStringLiteral("openai"), {});
        StreamRelay relay(pair.server(), session, 5000);
        RelayOutcome outcome;
        outcome.attach(&relay);
        relay.start();

        QTRY_VERIFY(outcome.finished);
        QVERIFY(outcome.keepAlive);
        QTRY_VERIFY(pair.received.endsWith("0\r\n\r\n"));
        QVERIFY(pair.received.startsWith("HTTP/1.1 200 OK\r\n"));
        QVERIFY(pair.received.contains("Transfer-Encoding: chunked"));
        QVERIFY(pair.received.contains("Hi there"));
        QVERIFY(pair.received.contains("data: [DONE]"));
        QVERIFY(!pair.clientClosed);
    }

    void testFailedStreamClosesConnection() {
        SocketPair pair;
        QVERIFY(pair.open());

        OpenAIOutbound outbound;
        OpenAIChatAdapter inbound;
        auto* reply = new FakeReply;
        auto* upstream = new StreamSession(reply, &outbound, QStringLiteral("openai"));
        auto* session = new PipelineStreamSession(upstream, &inbound, QStringLiteral("openai"), {});
        StreamRelay relay(pair.server(), session, 5000);
        RelayOutcome outcome;
        outcome.attach(&relay);
        relay.start();

        reply->push("data: {\"id\":\"c1\",\"model\":\"m\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"partial\"}}]}\n\n");
        QTRY_VERIFY(pair.received.contains("partial"));
        reply->drop();

        QTRY_VERIFY(outcome.finished);
        QVERIFY(!outcome.keepAlive);
        QTRY_VERIFY(pair.clientClosed);
        QCOMPARE(pair.received.count("\"subkind\":\"connect_failed\""), 1);
        QVERIFY(!pair.received.contains("[DONE]"));
    }

    void testIdleTimeoutEndsStream() {
        SocketPair pair;
        QVERIFY(pair.open());

        OpenAIOutbound outbound;
        OpenAIChatAdapter inbound;
        auto* reply = new FakeReply;
        bool replyEnded = false;
        connect(reply, &QNetworkReply::finished, this, [&replyEnded]() { replyEnded = true; });

        auto* upstream = new StreamSession(reply, &outbound, QStringLiteral("openai"));
        auto* session = new PipelineStreamSession(upstream, &inbound, QStringLiteral("openai"), {});
        StreamRelay relay(pair.server(), session, 100);
        RelayOutcome outcome;
        outcome.attach(&relay);
        relay.start();

        QTRY_VERIFY(outcome.finished);
        QVERIFY(!outcome.keepAlive);
        QVERIFY(replyEnded);
        QTRY_VERIFY(pair.clientClosed);
        QVERIFY(pair.received.contains("\"stream_timeout\""));
    }

    void testCallerDisconnectCancelsUpstream() {
        SocketPair pair;
        QVERIFY(pair.open());

        OpenAIOutbound outbound;
        OpenAIChatAdapter inbound;
        auto* reply = new FakeReply;
        bool replyEnded = false;
        connect(reply, &QNetworkReply::finished, this, [&replyEnded]() { replyEnded = true; });

        auto* upstream = new StreamSession(reply, &outbound, QStringLiteral("openai"));
        auto* session = new PipelineStreamSession(upstream, &inbound, QStringLiteral("openai"), {});
        QPointer<PipelineStreamSession> guard(session);
        StreamRelay relay(pair.server(), session, 5000);
        RelayOutcome outcome;
        outcome.attach(&relay);
        relay.start();

        reply->push("data: {\"id\":\"c1\",\"model\":\"m\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"a\"}}]}\n\n");
        QTRY_VERIFY(pair.received.contains("\"content\":\"a\""));

        pair.client().abort();
        QTRY_VERIFY(outcome.finished);
        QVERIFY(!outcome.keepAlive);
        QVERIFY(replyEnded);
        QVERIFY(guard);
        QVERIFY(guard->isDone());
        QVERIFY(!guard->hasFailed());
    }

    void testSlowCallerPausesUpstream() {
        SocketPair pair;
        QVERIFY(pair.open());

        OpenAIChatAdapter inbound;
        QList<StreamFrame> frames = textFrames(QString(300 * 1024, QLatin1Char('x')));
        const StreamFrame second = frames.at(1);
        frames.insert(2, second);
        auto* session = new PipelineStreamSession(frames, &inbound, QStringLiteral("openai"), {});
        StreamRelay relay(pair.server(), session, 5000);
        RelayOutcome outcome;
        outcome.attach(&relay);

        bool sawPause = false;
        connect(session, &PipelineStreamSession::encodedFrameReady, this,
                [&relay, &sawPause]() { sawPause = sawPause || relay.isPaused(); });
        relay.start();

        QTRY_VERIFY_WITH_TIMEOUT(outcome.finished, 10000);
        QVERIFY(sawPause);
        QVERIFY(outcome.keepAlive);
        QTRY_VERIFY_WITH_TIMEOUT(pair.received.endsWith("0\r\n\r\n"), 10000);
        QVERIFY(pair.received.size() > 600 * 1024);
    }

    void testStalledCallerIsDroppedAfterFailure() {
        SocketPair pair;
        QVERIFY(pair.open(false));
        QPointer<QTcpSocket> server(pair.server());

        OpenAIOutbound outbound;
        OpenAIChatAdapter inbound;
        auto* reply = new FakeReply;
        auto* upstream = new StreamSession(reply, &outbound, QStringLiteral("openai"));
        auto* session = new PipelineStreamSession(upstream, &inbound, QStringLiteral("openai"), {});
        StreamRelay relay(pair.server(), session, 100);
        RelayOutcome outcome;
        outcome.attach(&relay);
        relay.start();

        // More than loopback socket buffers hold.
        const QByteArray big(24 * 1024 * 1024, 'x');
        reply->push("data: {\"id\":\"c1\",\"model\":\"m\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\""
                    + big + "\"}}]}\n\n");

        QTRY_VERIFY_WITH_TIMEOUT(outcome.finished, 10000);
        QVERIFY(!outcome.keepAlive);
        QTRY_VERIFY_WITH_TIMEOUT(!server || server->state() == QAbstractSocket::UnconnectedState,
                                 5000);
    }
};

QTEST_MAIN(TestStreamRelay)
#include "tst_stream_relay.moc"
