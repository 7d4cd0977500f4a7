#include "sse_writer.h"
#include "core/log_manager.h"

void SseWriter::writeStreamHeader(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("SseWriter: cannot write stream header, socket not connected"));
        return;
    }

    const QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n";

    socket->write(header);
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // <hex-length>\r\n<data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

QByteArray SseWriter::toSseEvent(const QByteArray& data)
{
    const bool alreadySse =
        data.startsWith("event:") ||
        data.startsWith("data:") ||
        data.startsWith("id:") ||
        data.startsWith("retry:") ||
        data.startsWith(":");
    if (alreadySse)
        return data;

    QByteArray frame;
    frame.append("data: ");
    frame.append(data);
    frame.append("\n\n");
    return frame;
}

void SseWriter::sendChunk(QTcpSocket* socket, const QByteArray& sseData)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("SseWriter: dropping chunk, socket not connected"));
        return;
    }
    if (sseData.isEmpty())
        return;

    socket->write(wrapChunked(toSseEvent(sseData)));
}

void SseWriter::sendTerminator(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
}
