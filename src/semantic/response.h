#pragma once
#include "envelope.h"
#include "segment.h"
#include "action.h"
#include "extension.h"
#include "types.h"
#include <QList>
#include <QString>

struct UsageEntry {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;

    bool isEmpty() const { return promptTokens == 0 && completionTokens == 0 && totalTokens == 0; }
    bool operator==(const UsageEntry&) const = default;
};

struct Candidate {
    int index = 0;
    QString role = QStringLiteral("assistant");
    QList<Segment> output;
    QList<ActionCall> toolCalls;
    StopCause stopCause = StopCause::Completed;

    bool operator==(const Candidate&) const = default;
};

struct SemanticResponse {
    SemanticEnvelope envelope;
    QString responseId;
    QString modelUsed;
    QList<Candidate> candidates;
    UsageEntry usage;
    ExtensionBag extensions;
};
