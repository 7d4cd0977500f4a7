#pragma once
#include "envelope.h"
#include "segment.h"
#include "action.h"
#include "extension.h"
#include "failure.h"
#include "response.h"
#include "types.h"
#include <QList>
#include <optional>

// Started carries responseId / model (and prompt usage when known).
// Finished with isFinal == false is a stop cause announced before the
// upstream's own terminal marker; the stream session holds it back.
struct StreamFrame {
    SemanticEnvelope envelope;
    FrameType type = FrameType::Delta;
    int candidateIndex = 0;
    QString responseId;
    QString model;
    QList<Segment> deltaSegments;
    ActionDelta actionDelta;
    UsageEntry usageDelta;
    std::optional<StopCause> stopCause;
    DomainFailure failure;
    bool isFinal = false;
    ExtensionBag extensions;
};
