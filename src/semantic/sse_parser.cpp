#include "sse_parser.h"

void SseParser::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);
}

void SseParser::finish()
{
    if (!m_buffer.trimmed().isEmpty()) {
        m_buffer.append("\n\n");
    }
}

void SseParser::clear()
{
    m_buffer.clear();
}

std::optional<SseEvent> SseParser::next()
{
    while (true) {
        // SSE events are delimited by a blank line. Check "\r\n\r\n" first
        // (longer delimiter) to avoid partial matches, then fall back to
        // "\n\n".
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0) {
            return std::nullopt;
        }

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);

        SseEvent event;
        QList<QByteArray> dataLines;

        const QList<QByteArray> lines = block.split('\n');
        for (const QByteArray& rawLine : lines) {
            QByteArray line = rawLine;
            if (line.endsWith('\r')) {
                line.chop(1);
            }

            if (line.isEmpty() || line.startsWith(':')) {
                // Blank line or comment (heartbeat/keepalive).
                continue;
            }

            if (line.startsWith("event:")) {
                event.type = QString::fromUtf8(line.mid(6).trimmed());
            } else if (line.startsWith("data:")) {
                QByteArray value = line.mid(5);
                if (value.startsWith(' ')) {
                    value.remove(0, 1);
                }
                dataLines.append(value);
            }
            // id:, retry: and unknown fields are ignored.
        }

        if (dataLines.isEmpty()) {
            // An event without data carries nothing to decode.
            continue;
        }

        event.data = dataLines.join('\n');
        return event;
    }
}
