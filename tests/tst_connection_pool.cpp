#include <QTest>
#include <QPointer>
#include <QTcpServer>
#include <optional>
#include "proxy/connection_pool.h"
#include "adapters/executor/qt_executor.h"
#include "semantic/upstream_call.h"
#include "fake_reply.h"

namespace {

// Accepts connections and never answers.
struct SilentServer {
    QTcpServer server;

    bool listen() { return server.listen(QHostAddress::LocalHost); }
    QString url() const {
        return QStringLiteral("http://127.0.0.1:%1/v1/messages").arg(server.serverPort());
    }
};

ProviderRequest requestTo(const QString& url, bool stream) {
    ProviderRequest req;
    req.url = url;
    req.method = QStringLiteral("POST");
    req.body = QByteArrayLiteral("{}");
    req.stream = stream;
    req.adapterHint = QStringLiteral("anthropic");
    return req;
}

void flushDeletes() {
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

}

class TestConnectionPool : public QObject {
    Q_OBJECT

private slots:
    void testDestinationKey() {
        QCOMPARE(ConnectionPool::destinationKey(QUrl(QStringLiteral("HTTPS://API.Anthropic.com/v1/messages"))),
                 QStringLiteral("https://api.anthropic.com:443"));
        QCOMPARE(ConnectionPool::destinationKey(QUrl(QStringLiteral("http://localhost/x"))),
                 QStringLiteral("http://localhost:80"));
        QCOMPARE(ConnectionPool::destinationKey(QUrl(QStringLiteral("http://127.0.0.1:8080/a?b=c"))),
                 QStringLiteral("http://127.0.0.1:8080"));
    }

    void testReleasedManagerIsReused() {
        ConnectionPool pool{TransportConfig()};
        QNetworkAccessManager* first = pool.acquire(QUrl(QStringLiteral("https://api.openai.com/v1")));
        QVERIFY(first);
        QCOMPARE(pool.activeCount(), 1);
        QCOMPARE(pool.idleCount(), 0);

        pool.release(first);
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);

        QNetworkAccessManager* again = pool.acquire(QUrl(QStringLiteral("https://api.openai.com/v1/responses")));
        QCOMPARE(again, first);
        QCOMPARE(pool.activeCount(), 1);
        QCOMPARE(pool.idleCount(), 0);
        pool.release(again);
    }

    void testDestinationsHaveSeparateBuckets() {
        ConnectionPool pool{TransportConfig()};
        QNetworkAccessManager* a = pool.acquire(QUrl(QStringLiteral("https://api.anthropic.com/v1")));
        QNetworkAccessManager* b = pool.acquire(QUrl(QStringLiteral("https://chatgpt.com/backend-api")));
        QVERIFY(a != b);
        QCOMPARE(pool.destinationCount(), 2);
        QCOMPARE(pool.activeCount(), 2);

        pool.release(a);
        QNetworkAccessManager* other = pool.acquire(QUrl(QStringLiteral("https://chatgpt.com/x")));
        QVERIFY(other != a);
        QCOMPARE(pool.idleCount(), 1);
        pool.release(b);
        pool.release(other);
        QCOMPARE(pool.destinationCount(), 2);
    }

    void testOverflowManagersAreNotKept() {
        ConnectionPool pool(TransportConfig(), 2);
        const QUrl url(QStringLiteral("http://upstream.test/v1"));
        QList<QPointer<QNetworkAccessManager>> managers;
        for (int i = 0; i < 3; ++i)
            managers.append(pool.acquire(url));
        QCOMPARE(pool.activeCount(), 3);

        for (const auto& nam : managers)
            pool.release(nam);
        flushDeletes();
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 2);
        int alive = 0;
        for (const auto& nam : managers)
            alive += nam ? 1 : 0;
        QCOMPARE(alive, 2);
    }

    void testReleaseWithFollowsReply() {
        ConnectionPool pool{TransportConfig()};
        QNetworkAccessManager* nam = pool.acquire(QUrl(QStringLiteral("http://upstream.test")));
        auto* reply = new FakeReply;
        pool.releaseWith(reply, nam);
        QCOMPARE(pool.activeCount(), 1);

        delete reply;
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testClearRetiresManagersInUse() {
        ConnectionPool pool{TransportConfig()};
        const QUrl url(QStringLiteral("http://upstream.test"));
        QPointer<QNetworkAccessManager> busy = pool.acquire(url);
        QPointer<QNetworkAccessManager> idle = pool.acquire(url);
        pool.release(idle);
        QCOMPARE(pool.idleCount(), 1);

        pool.clear();
        QVERIFY(!idle);
        QVERIFY(busy);
        QCOMPARE(pool.idleCount(), 0);
        QCOMPARE(pool.activeCount(), 1);

        pool.release(busy);
        flushDeletes();
        QVERIFY(!busy);
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 0);

        // A fresh manager after clearing.
        QNetworkAccessManager* fresh = pool.acquire(url);
        QVERIFY(fresh);
        pool.release(fresh);
    }

    void testDestructionDeletesManagersInUse() {
        QPointer<QNetworkAccessManager> nam;
        QPointer<FakeReply> reply;
        {
            ConnectionPool pool{TransportConfig()};
            nam = pool.acquire(QUrl(QStringLiteral("http://upstream.test")));
            reply = new FakeReply(200, nam);
            pool.releaseWith(reply, nam);
        }
        QVERIFY(!nam);
        QVERIFY(!reply);
    }

    void testTimedOutRequestReturnsManager() {
        SilentServer upstream;
        QVERIFY(upstream.listen());
        ConnectionPool pool{TransportConfig()};
        QtExecutor executor(pool, TransportConfig());
        executor.setRequestTimeout(200);

        std::optional<DomainFailure> failure;
        UpstreamCall* call = executor.start(requestTo(upstream.url(), false));
        connect(call, &UpstreamCall::failed, this, [&failure](const DomainFailure& f) { failure = f; });
        QCOMPARE(pool.activeCount(), 1);

        QTRY_VERIFY(failure.has_value());
        QCOMPARE(failure->kind, ErrorKind::UpstreamTimeout);
        QTRY_COMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testStreamWithoutHeadersTimesOut() {
        SilentServer upstream;
        QVERIFY(upstream.listen());
        ConnectionPool pool{TransportConfig()};
        QtExecutor executor(pool, TransportConfig());
        executor.setConnectionTimeout(200);

        std::optional<DomainFailure> failure;
        bool opened = false;
        UpstreamCall* call = executor.start(requestTo(upstream.url(), true));
        connect(call, &UpstreamCall::failed, this, [&failure](const DomainFailure& f) { failure = f; });
        connect(call, &UpstreamCall::streamOpened, this, [&opened]() { opened = true; });

        QTRY_VERIFY(failure.has_value());
        QVERIFY(!opened);
        QCOMPARE(failure->kind, ErrorKind::UpstreamTimeout);
        QTRY_COMPARE(pool.activeCount(), 0);
    }

    void testAbortedRequestReturnsManager() {
        SilentServer upstream;
        QVERIFY(upstream.listen());
        ConnectionPool pool{TransportConfig()};
        QtExecutor executor(pool, TransportConfig());

        int outcomes = 0;
        QPointer<UpstreamCall> call = executor.start(requestTo(upstream.url(), false));
        connect(call, &UpstreamCall::failed, this, [&outcomes]() { ++outcomes; });
        connect(call, &UpstreamCall::responseReady, this, [&outcomes]() { ++outcomes; });
        QCOMPARE(pool.activeCount(), 1);

        call->abort();
        QVERIFY(call->isDone());
        QTRY_VERIFY(!call);
        QTRY_COMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);
        QCOMPARE(outcomes, 0);
    }
};

QTEST_MAIN(TestConnectionPool)
#include "tst_connection_pool.moc"
