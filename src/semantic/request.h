#pragma once
#include "envelope.h"
#include "segment.h"
#include "action.h"
#include "constraints.h"
#include "extension.h"
#include "types.h"
#include <QList>
#include <QMap>
#include <QString>

struct InteractionItem {
    QString role;
    QList<Segment> content;
    QList<ActionCall> toolCalls;
    QString toolCallId;
    QString name;
    bool isError = false;

    bool operator==(const InteractionItem&) const = default;
};

struct SemanticRequest {
    SemanticEnvelope envelope;
    QString model;
    QList<InteractionItem> messages;
    ConstraintSet constraints;
    QList<ActionSpec> tools;
    ToolChoice toolChoice;
    bool stream = false;
    QMap<QString, QString> metadata;
    ExtensionBag extensions;
};
