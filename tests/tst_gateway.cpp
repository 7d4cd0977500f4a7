#include <QTest>
#include <QDeadlineTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QFile>
#include <QSslKey>
#include <QSslServer>
#include <QSslSocket>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <functional>
#include <memory>
#include "core/gateway.h"

namespace {

// Scripted HTTP/1.1 upstream (or forward proxy) on loopback.
class FakeUpstream {
public:
    struct Request {
        QByteArray requestLine;
        QMap<QByteArray, QByteArray> headers;
        QByteArray body;

        QJsonObject json() const { return QJsonDocument::fromJson(body).object(); }
    };

    std::function<void(QTcpSocket*)> responder;
    QList<Request> requests;
    int disconnects = 0;

    bool listen() {
        m_server = std::make_unique<QTcpServer>();
        return start();
    }

    // TLS with the given certificate; false when no TLS backend is available.
    bool listenTls(const QString& certPath, const QString& keyPath) {
        QFile certFile(certPath);
        QFile keyFile(keyPath);
        if (!QSslSocket::supportsSsl() || !certFile.open(QIODevice::ReadOnly)
            || !keyFile.open(QIODevice::ReadOnly))
            return false;
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setLocalCertificate(QSslCertificate(certFile.readAll(), QSsl::Pem));
        ssl.setPrivateKey(QSslKey(keyFile.readAll(), QSsl::Rsa, QSsl::Pem));
        auto server = std::make_unique<QSslServer>();
        server->setSslConfiguration(ssl);
        m_server = std::move(server);
        m_tls = true;
        return start();
    }

    QString url(const QString& path) const {
        return QStringLiteral("%1://127.0.0.1:%2%3")
            .arg(m_tls ? QStringLiteral("https") : QStringLiteral("http"))
            .arg(m_server->serverPort())
            .arg(path);
    }
    quint16 port() const { return m_server->serverPort(); }

    static void replyJson(QTcpSocket* socket, const QByteArray& json) {
        socket->write("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: "
                      + QByteArray::number(json.size()) + "\r\n\r\n" + json);
    }

    // Chunked event stream; dropAfter closes the connection instead of
    // sending the terminating chunk.
    static void replyEvents(QTcpSocket* socket, const QList<QByteArray>& events, bool dropAfter) {
        socket->write("HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n"
                      "Transfer-Encoding: chunked\r\n\r\n");
        for (const QByteArray& e : events)
            socket->write(QByteArray::number(e.size(), 16) + "\r\n" + e + "\r\n");
        if (dropAfter) {
            socket->flush();
            QTimer::singleShot(100, socket, [socket]() { socket->abort(); });
        } else {
            socket->write("0\r\n\r\n");
        }
    }

private:
    std::unique_ptr<QTcpServer> m_server;
    bool m_tls = false;
    QHash<QTcpSocket*, QByteArray> m_buffers;

    bool start() {
        // Emitted once a connection is ready, after the handshake for TLS.
        QObject::connect(m_server.get(), &QTcpServer::pendingConnectionAvailable, m_server.get(),
                         [this]() {
            while (m_server->hasPendingConnections()) {
                QTcpSocket* socket = m_server->nextPendingConnection();
                QObject::connect(socket, &QTcpSocket::readyRead, socket,
                                 [this, socket]() { onData(socket); });
                QObject::connect(socket, &QTcpSocket::disconnected, socket, [this, socket]() {
                    ++disconnects;
                    m_buffers.remove(socket);
                });
            }
        });
        return m_server->listen(QHostAddress::LocalHost);
    }

    void onData(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();
        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0)
            return;

        Request req;
        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        req.requestLine = lines.value(0).trimmed();
        for (qsizetype i = 1; i < lines.size(); ++i) {
            const qsizetype colon = lines[i].indexOf(':');
            if (colon > 0)
                req.headers[lines[i].left(colon).trimmed().toLower()] = lines[i].mid(colon + 1).trimmed();
        }
        const qsizetype length = req.headers.value("content-length").toLongLong();
        if (buffer.size() < headerEnd + 4 + length)
            return;
        req.body = buffer.mid(headerEnd + 4, length);
        buffer.remove(0, headerEnd + 4 + length);

        requests.append(req);
        if (responder)
            responder(socket);
    }
};

QByteArray sseEvent(const QByteArray& name, const QByteArray& json) {
    return "event: " + name + "\ndata: " + json + "\n\n";
}

QByteArray dechunk(const QByteArray& body) {
    QByteArray out;
    qsizetype pos = 0;
    while (pos < body.size()) {
        const qsizetype lineEnd = body.indexOf("\r\n", pos);
        if (lineEnd < 0)
            break;
        bool ok = false;
        const qsizetype size = body.mid(pos, lineEnd - pos).trimmed().toLongLong(&ok, 16);
        if (!ok || size == 0)
            break;
        out += body.mid(lineEnd + 2, size);
        pos = lineEnd + 2 + size + 2;
    }
    return out;
}

struct HttpResult {
    int status = 0;
    QMap<QByteArray, QByteArray> headers;
    QByteArray body;
    bool closed = false;

    QJsonObject json() const { return QJsonDocument::fromJson(body).object(); }
};

bool responseComplete(const QByteArray& raw) {
    const qsizetype headerEnd = raw.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return false;
    const QByteArray head = raw.left(headerEnd).toLower();
    if (head.contains("transfer-encoding: chunked"))
        return raw.endsWith("0\r\n\r\n");
    const qsizetype at = head.indexOf("content-length:");
    if (at < 0)
        return false;
    const qsizetype eol = head.indexOf("\r\n", at);
    const qsizetype length = head.mid(at + 15, eol < 0 ? -1 : eol - at - 15).trimmed().toLongLong();
    return raw.size() >= headerEnd + 4 + length;
}

HttpResult callGateway(quint16 port, const QByteArray& method, const QByteArray& path,
                       const QByteArray& body = QByteArray(),
                       const QList<QByteArray>& extraHeaders = {}) {
    HttpResult result;
    QTcpSocket socket;
    QByteArray raw;
    QObject::connect(&socket, &QTcpSocket::readyRead, &socket, [&]() { raw += socket.readAll(); });
    QObject::connect(&socket, &QTcpSocket::disconnected, &socket, [&]() { result.closed = true; });

    socket.connectToHost(QHostAddress::LocalHost, port);
    if (!socket.waitForConnected(2000))
        return result;

    QByteArray request = method + ' ' + path + " HTTP/1.1\r\nHost: localhost\r\n";
    for (const QByteArray& h : extraHeaders)
        request += h + "\r\n";
    if (!body.isEmpty())
        request += "Content-Type: application/json\r\nContent-Length: "
                   + QByteArray::number(body.size()) + "\r\n";
    request += "\r\n" + body;
    socket.write(request);

    QDeadlineTimer deadline(10000);
    while (!deadline.hasExpired() && !result.closed && !responseComplete(raw))
        QTest::qWait(10);
    // A failed stream closes right after its terminator.
    if (!result.closed)
        QTest::qWait(50);
    raw += socket.readAll();

    const qsizetype headerEnd = raw.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return result;
    const QList<QByteArray> lines = raw.left(headerEnd).split('\n');
    result.status = lines.value(0).split(' ').value(1).toInt();
    for (qsizetype i = 1; i < lines.size(); ++i) {
        const qsizetype colon = lines[i].indexOf(':');
        if (colon > 0)
            result.headers[lines[i].left(colon).trimmed().toLower()] = lines[i].mid(colon + 1).trimmed();
    }
    result.body = raw.mid(headerEnd + 4);
    if (result.headers.value("transfer-encoding") == "chunked")
        result.body = dechunk(result.body);
    return result;
}

struct WireEvent {
    QString name;
    QJsonObject data;
};

QList<WireEvent> parseEvents(const QByteArray& sse) {
    QList<WireEvent> events;
    for (const QByteArray& line : sse.split('\n')) {
        if (line.startsWith("event: "))
            events.append({QString::fromUtf8(line.mid(7)), QJsonObject()});
        else if (line.startsWith("data: ") && !events.isEmpty())
            events.last().data = QJsonDocument::fromJson(line.mid(6)).object();
    }
    return events;
}

const QByteArray kAnthropicMessage = R"({
    "id": "msg_01", "type": "message", "role": "assistant", "model": "claude-sonnet-4",
    "content": [{"type": "text", "text": "Hello from upstream"}],
    "stop_reason": "end_turn",
    "usage": {"input_tokens": 5, "output_tokens": 3}
})";

const QByteArray kChatBody = R"({
    "model": "claude-sonnet-4",
    "messages": [{"role": "user", "content": "hi"}]
})";

// A caller request left in flight while the test does other things.
class PendingCall {
public:
    void send(quint16 port, const QByteArray& path, const QByteArray& body) {
        QObject::connect(&m_socket, &QTcpSocket::readyRead, &m_socket,
                         [this]() { m_raw += m_socket.readAll(); });
        m_socket.connectToHost(QHostAddress::LocalHost, port);
        m_socket.write("POST " + path + " HTTP/1.1\r\nHost: localhost\r\n"
                       "Content-Type: application/json\r\nContent-Length: "
                       + QByteArray::number(body.size()) + "\r\n\r\n" + body);
    }

    bool done() const { return responseComplete(m_raw); }
    QByteArray raw() const { return m_raw; }
    void abort() { m_socket.abort(); }

private:
    QTcpSocket m_socket;
    QByteArray m_raw;
};

QByteArray chatAsking(const QByteArray& content) {
    return R"({"model":"claude-sonnet-4","messages":[{"role":"user","content":")" + content + R"("}]})";
}

// Answers each request after the delay named in its text, "delay:<ms>".
void replyAfterDelay(FakeUpstream& upstream, QTcpSocket* socket) {
    const QJsonArray messages = upstream.requests.last().json()
        .value(QStringLiteral("messages")).toArray();
    QString text = messages.isEmpty() ? QString()
        : messages.first().toObject().value(QStringLiteral("content")).toString();
    if (text.isEmpty() && !messages.isEmpty()) {
        const QJsonArray blocks = messages.first().toObject()
            .value(QStringLiteral("content")).toArray();
        if (!blocks.isEmpty())
            text = blocks.first().toObject().value(QStringLiteral("text")).toString();
    }
    const int delay = text.startsWith(QLatin1String("delay:")) ? text.mid(6).toInt() : 0;
    QTimer::singleShot(delay, socket, [socket]() { FakeUpstream::replyJson(socket, kAnthropicMessage); });
}

ProxyConfig gatewayConfig(const QString& anthropicBase, const QString& codexBase) {
    ProxyConfig config = ProxyConfig::defaults();
    config.listen.port = 0;
    config.runtime.requestTimeout = 5000;
    config.runtime.connectionTimeout = 2000;
    config.runtime.streamIdleTimeout = 5000;
    for (UpstreamConfig& u : config.upstreams) {
        if (u.name == QLatin1String("anthropic")) {
            u.baseUrl = anthropicBase;
            u.apiKey = QStringLiteral("sk-ant-test");
        } else if (u.name == QLatin1String("codex")) {
            u.baseUrl = codexBase;
        }
    }
    config.modelMap[QStringLiteral("gpt-5")] = QStringLiteral("gpt-5-codex");
    return config;
}

}

class TestGateway : public QObject {
    Q_OBJECT

private slots:
    void testHealth() {
        Gateway gateway(gatewayConfig(QStringLiteral("http://127.0.0.1:1/v1"),
                                      QStringLiteral("http://127.0.0.1:1/codex")),
                        TransportConfig());
        QVERIFY2(gateway.start(), qPrintable(gateway.lastError()));
        QVERIFY(gateway.isRunning());
        QVERIFY(gateway.serverPort() != 0);

        const HttpResult res = callGateway(gateway.serverPort(), "GET", "/health");
        QCOMPARE(res.status, 200);
        QCOMPARE(res.json().value(QStringLiteral("status")).toString(), QStringLiteral("ok"));
    }

    void testUnroutable() {
        Gateway gateway(gatewayConfig(QStringLiteral("http://127.0.0.1:1/v1"),
                                      QStringLiteral("http://127.0.0.1:1/codex")),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST", "/v9/nothing", kChatBody);
        QCOMPARE(res.status, 404);
        QCOMPARE(res.json().value(QStringLiteral("error")).toObject()
                     .value(QStringLiteral("type")).toString(),
                 QStringLiteral("unroutable_request"));
    }

    void testOverlappingBindingsRefuseToStart() {
        ProxyConfig config = gatewayConfig(QStringLiteral("http://127.0.0.1:1/v1"),
                                           QStringLiteral("http://127.0.0.1:1/codex"));
        config.bindings.append(config.bindings.first());
        Gateway gateway(config, TransportConfig());
        QVERIFY(!gateway.start());
        QVERIFY(!gateway.lastError().isEmpty());
        QVERIFY(!gateway.isRunning());
    }

    void testQuirkEndpointAnswersInAnthropicShape() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 200);
        const QJsonObject body = res.json();
        QCOMPARE(body.value(QStringLiteral("type")).toString(), QStringLiteral("message"));
        QCOMPARE(body.value(QStringLiteral("content")).toArray()[0].toObject()
                     .value(QStringLiteral("text")).toString(),
                 QStringLiteral("Hello from upstream"));

        QCOMPARE(upstream.requests.size(), 1);
        const FakeUpstream::Request& sent = upstream.requests.first();
        QVERIFY(sent.requestLine.startsWith("POST /v1/messages "));
        QCOMPARE(sent.headers.value("x-api-key"), QByteArray("sk-ant-test"));
        QCOMPARE(sent.headers.value("anthropic-version"), QByteArray("2023-06-01"));
        QCOMPARE(sent.json().value(QStringLiteral("model")).toString(), QStringLiteral("claude-sonnet-4"));
        QVERIFY(sent.json().contains(QStringLiteral("max_tokens")));
    }

    void testCcEndpointAnswersInOpenAIShape() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/cc/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 200);
        const QJsonObject body = res.json();
        QCOMPARE(body.value(QStringLiteral("object")).toString(), QStringLiteral("chat.completion"));
        const QJsonObject choice = body.value(QStringLiteral("choices")).toArray()[0].toObject();
        QCOMPARE(choice.value(QStringLiteral("message")).toObject()
                     .value(QStringLiteral("content")).toString(),
                 QStringLiteral("Hello from upstream"));
        QCOMPARE(choice.value(QStringLiteral("finish_reason")).toString(), QStringLiteral("stop"));
        QCOMPARE(body.value(QStringLiteral("usage")).toObject()
                     .value(QStringLiteral("total_tokens")).toInt(), 8);
    }

    void testKeepAliveServesSecondRequest() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        QCOMPARE(callGateway(gateway.serverPort(), "POST", "/cc/openai/v1/chat/completions",
                             kChatBody).status, 200);
        QCOMPARE(callGateway(gateway.serverPort(), "POST", "/cc/openai/v1/chat/completions",
                             kChatBody).status, 200);
        QCOMPARE(upstream.requests.size(), 2);
    }

    void testUpstreamErrorIsBadGateway() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) {
            const QByteArray body = R"({"type":"error","error":{"type":"overloaded_error","message":"busy"}})";
            s->write("HTTP/1.1 529 Overloaded\r\nContent-Type: application/json\r\nContent-Length: "
                     + QByteArray::number(body.size()) + "\r\n\r\n" + body);
        };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST", "/v1/messages",
            R"({"model":"claude-sonnet-4","max_tokens":64,"messages":[{"role":"user","content":"hi"}]})");
        QCOMPARE(res.status, 502);
        const QJsonObject error = res.json().value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("type")).toString(), QStringLiteral("transport_error"));
        QCOMPARE(error.value(QStringLiteral("upstream_status")).toInt(), 529);
    }

    void testCodexStreamEchoesUpstreamModel() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) {
            FakeUpstream::replyEvents(s, {
                sseEvent("response.created",
                    R"({"type":"response.created","response":{"id":"resp_g","model":"gpt-5-codex","status":"in_progress"}})"),
                sseEvent("response.output_text.delta",
                    R"({"type":"response.output_text.delta","output_index":0,"delta":"Hel"})"),
                sseEvent("response.output_text.delta",
                    R"({"type":"response.output_text.delta","output_index":0,"delta":"lo"})"),
                sseEvent("response.completed",
                    R"({"type":"response.completed","response":{"id":"resp_g","model":"gpt-5-codex","status":"completed","usage":{"input_tokens":6,"output_tokens":2}}})"),
            }, false);
        };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/backend-api/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST", "/codex/responses",
            R"({"model":"gpt-5","input":"hi","stream":true})",
            {"Authorization: Bearer chatgpt-token", "chatgpt-account-id: acct_1"});
        QCOMPARE(res.status, 200);
        QCOMPARE(res.headers.value("content-type"), QByteArray("text/event-stream"));

        const QList<WireEvent> events = parseEvents(res.body);
        QVERIFY(events.size() >= 4);
        int terminal = 0;
        for (const WireEvent& e : events) {
            QCOMPARE(e.data.value(QStringLiteral("model")).toString(), QStringLiteral("gpt-5-codex"));
            if (e.name.startsWith(QLatin1String("response.completed"))
                || e.name == QLatin1String("response.failed")
                || e.name == QLatin1String("response.incomplete"))
                ++terminal;
        }
        QCOMPARE(terminal, 1);
        QCOMPARE(events.last().name, QStringLiteral("response.completed"));
        QVERIFY(!res.closed);

        QCOMPARE(upstream.requests.size(), 1);
        const FakeUpstream::Request& sent = upstream.requests.first();
        QVERIFY(sent.requestLine.startsWith("POST /backend-api/codex/responses "));
        QCOMPARE(sent.headers.value("authorization"), QByteArray("Bearer chatgpt-token"));
        QCOMPARE(sent.headers.value("chatgpt-account-id"), QByteArray("acct_1"));
        QCOMPARE(sent.json().value(QStringLiteral("model")).toString(), QStringLiteral("gpt-5-codex"));
        QCOMPARE(sent.json().value(QStringLiteral("stream")).toBool(), true);
    }

    void testMidStreamDropSendsOneErrorEvent() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [](QTcpSocket* s) {
            FakeUpstream::replyEvents(s, {
                sseEvent("message_start",
                    R"({"type":"message_start","message":{"id":"msg_s","type":"message","role":"assistant","model":"claude-sonnet-4","content":[],"usage":{"input_tokens":4,"output_tokens":0}}})"),
                sseEvent("content_block_start",
                    R"({"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}})"),
                sseEvent("content_block_delta",
                    R"({"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"Par"}})"),
            }, true);
        };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST", "/v1/messages",
            R"({"model":"claude-sonnet-4","max_tokens":64,"stream":true,"messages":[{"role":"user","content":"hi"}]})");
        QCOMPARE(res.status, 200);
        QVERIFY(res.closed);

        const QList<WireEvent> events = parseEvents(res.body);
        QVERIFY(!events.isEmpty());
        QCOMPARE(events.first().name, QStringLiteral("message_start"));
        int errors = 0;
        for (const WireEvent& e : events) {
            QVERIFY(e.name != QLatin1String("message_stop"));
            if (e.name == QLatin1String("error"))
                ++errors;
        }
        QCOMPARE(errors, 1);
        QCOMPARE(events.last().name, QStringLiteral("error"));
        const QJsonObject error = events.last().data.value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("subkind")).toString(), QStringLiteral("connect_failed"));
        QVERIFY(res.body.contains("Par"));
    }

    void testRoutesThroughHttpProxy() {
        FakeUpstream proxy;
        QVERIFY(proxy.listen());
        proxy.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        QProcessEnvironment env;
        env.insert(QStringLiteral("HTTP_PROXY"), proxy.url(QString()));
        auto transport = TransportConfig::fromEnvironment(env);
        QVERIFY(transport.has_value());

        Gateway gateway(gatewayConfig(QStringLiteral("http://upstream.invalid/v1"),
                                      QStringLiteral("http://upstream.invalid/codex")),
                        *transport);
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/cc/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 200);
        QCOMPARE(res.json().value(QStringLiteral("object")).toString(), QStringLiteral("chat.completion"));

        QCOMPARE(proxy.requests.size(), 1);
        QVERIFY(proxy.requests.first().requestLine.startsWith(
            "POST http://upstream.invalid/v1/messages "));
    }

    void testSlowRequestDoesNotHoldBackFastOne() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [&upstream](QTcpSocket* s) { replyAfterDelay(upstream, s); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        PendingCall slow;
        slow.send(gateway.serverPort(), "/cc/openai/v1/chat/completions", chatAsking("delay:1500"));
        QTRY_COMPARE(upstream.requests.size(), 1);

        PendingCall fast;
        fast.send(gateway.serverPort(), "/cc/openai/v1/chat/completions", chatAsking("now"));
        QTRY_VERIFY(fast.done());
        QVERIFY(!slow.done());
        QVERIFY(fast.raw().startsWith("HTTP/1.1 200"));

        QTRY_VERIFY_WITH_TIMEOUT(slow.done(), 5000);
        QVERIFY(slow.raw().startsWith("HTTP/1.1 200"));
    }

    void testEarlierRequestReturnsWhileLaterOneWaits() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [&upstream](QTcpSocket* s) { replyAfterDelay(upstream, s); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        PendingCall first;
        first.send(gateway.serverPort(), "/cc/openai/v1/chat/completions", chatAsking("delay:300"));
        QTRY_COMPARE(upstream.requests.size(), 1);
        PendingCall second;
        second.send(gateway.serverPort(), "/cc/openai/v1/chat/completions", chatAsking("delay:3000"));
        QTRY_COMPARE(upstream.requests.size(), 2);

        QTRY_VERIFY_WITH_TIMEOUT(first.done(), 2000);
        QVERIFY(!second.done());
        QTRY_VERIFY_WITH_TIMEOUT(second.done(), 6000);
    }

    void testCallerDisconnectCancelsUpstreamRequest() {
        FakeUpstream upstream;
        QVERIFY(upstream.listen());
        upstream.responder = [&upstream](QTcpSocket* s) { replyAfterDelay(upstream, s); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        PendingCall call;
        call.send(gateway.serverPort(), "/cc/openai/v1/chat/completions", chatAsking("delay:20000"));
        QTRY_COMPARE(upstream.requests.size(), 1);
        QCOMPARE(upstream.disconnects, 0);

        call.abort();
        QTRY_COMPARE(upstream.disconnects, 1);

        // The server keeps answering others.
        QCOMPARE(callGateway(gateway.serverPort(), "GET", "/health").status, 200);
    }

    void testTlsUpstreamWithVerificationOff() {
        FakeUpstream upstream;
        if (!upstream.listenTls(QFINDTESTDATA("data/localhost.pem"), QFINDTESTDATA("data/localhost.key")))
            QSKIP("No TLS backend available");
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        QProcessEnvironment env;
        env.insert(QStringLiteral("SSL_VERIFY"), QStringLiteral("0"));
        auto transport = TransportConfig::fromEnvironment(env);
        QVERIFY(transport.has_value());

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        *transport);
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/cc/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 200);
        QCOMPARE(res.json().value(QStringLiteral("object")).toString(), QStringLiteral("chat.completion"));
        QCOMPARE(upstream.requests.size(), 1);
    }

    void testTlsUpstreamTrustedThroughCaBundle() {
        FakeUpstream upstream;
        const QString cert = QFINDTESTDATA("data/localhost.pem");
        if (!upstream.listenTls(cert, QFINDTESTDATA("data/localhost.key")))
            QSKIP("No TLS backend available");
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        QProcessEnvironment env;
        env.insert(QStringLiteral("REQUESTS_CA_BUNDLE"), cert);
        auto transport = TransportConfig::fromEnvironment(env);
        QVERIFY(transport.has_value());
        QVERIFY(transport->verifyPeer());

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        *transport);
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/cc/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 200);
    }

    void testUntrustedTlsUpstreamIsRefused() {
        FakeUpstream upstream;
        if (!upstream.listenTls(QFINDTESTDATA("data/localhost.pem"), QFINDTESTDATA("data/localhost.key")))
            QSKIP("No TLS backend available");
        upstream.responder = [](QTcpSocket* s) { FakeUpstream::replyJson(s, kAnthropicMessage); };

        Gateway gateway(gatewayConfig(upstream.url(QStringLiteral("/v1")),
                                      upstream.url(QStringLiteral("/codex"))),
                        TransportConfig());
        QVERIFY(gateway.start());

        const HttpResult res = callGateway(gateway.serverPort(), "POST",
                                           "/cc/openai/v1/chat/completions", kChatBody);
        QCOMPARE(res.status, 502);
        QVERIFY(upstream.requests.isEmpty());
    }
};

QTEST_MAIN(TestGateway)
#include "tst_gateway.moc"
