#pragma once
#include <QByteArray>
#include <QList>
#include <QString>
#include <optional>

struct SseEvent {
    QString type;
    QByteArray data;
};

// Incremental text/event-stream parser. Bytes go in through feed(); complete
// events come out one at a time through next(), so a consumer can stop
// between events and leave the remainder buffered.
class SseParser {
public:
    void feed(const QByteArray& bytes);

    // Appends the blank line a stream may omit before EOF.
    void finish();

    std::optional<SseEvent> next();

    int bufferedBytes() const { return m_buffer.size(); }
    void clear();

private:
    QByteArray m_buffer;
};
