#pragma once
#include <QTcpSocket>
#include <QByteArray>

// HTTP/1.1 chunked framing for event-stream responses.
class SseWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket);
    static void sendChunk(QTcpSocket* socket, const QByteArray& sseData);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
    // Adds "data: ...\n\n" framing when the payload is bare JSON.
    static QByteArray toSseEvent(const QByteArray& data);
};
