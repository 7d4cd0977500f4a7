#pragma once
#include "types.h"
#include <QString>
#include <QByteArray>
#include <QJsonObject>

struct MediaRef {
    QString mimeType;
    QString uri;
    QByteArray inlineData;

    bool operator==(const MediaRef&) const = default;
};

// One unit of message content.
//  Text       - text
//  Media      - media (image / document reference)
//  Reasoning  - text holds the reasoning, structured may hold "signature"
//               or "encrypted_content"
//  Structured - structured is an opaque block, originFormat names the wire
//               format it came from; it is only ever re-emitted there
// extras carries unmapped keys of the source block (cache_control, detail).
struct Segment {
    SegmentKind kind = SegmentKind::Text;
    QString text;
    MediaRef media;
    QJsonObject structured;
    QString originFormat;
    QJsonObject extras;

    bool operator==(const Segment&) const = default;

    static Segment fromText(const QString& text) {
        Segment s;
        s.kind = SegmentKind::Text;
        s.text = text;
        return s;
    }
    static Segment fromMedia(const MediaRef& ref) {
        Segment s;
        s.kind = SegmentKind::Media;
        s.media = ref;
        return s;
    }
    static Segment fromReasoning(const QString& text) {
        Segment s;
        s.kind = SegmentKind::Reasoning;
        s.text = text;
        return s;
    }
    static Segment fromStructured(const QJsonObject& block, const QString& originFormat) {
        Segment s;
        s.kind = SegmentKind::Structured;
        s.structured = block;
        s.originFormat = originFormat;
        return s;
    }
};
