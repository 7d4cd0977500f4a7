#pragma once
#include "semantic/frame.h"
#include "semantic/ports.h"
#include <QList>
#include <QMap>

// Holds tool-call argument fragments back until each call is structurally
// complete, so callers never see a partial JSON argument.
//
// Per slot: Collecting -> Promoted. A slot is promoted when its buffered
// arguments parse as a complete JSON object or array, or when the upstream
// closes the call. Promotion yields one closed ActionDelta carrying the
// full arguments text, byte for byte as received.
class ToolCallAssembler {
public:
    Result<QList<StreamFrame>> accept(const StreamFrame& fragment);

    // Promotes every call still collecting, in slot order.
    QList<StreamFrame> flush();

    void discard();
    bool hasPending() const;

    static bool isStructurallyComplete(const QString& args);

private:
    enum class SlotState : quint8 { Collecting, Promoted };

    struct PendingCall {
        SlotState state = SlotState::Collecting;
        int candidateIndex = 0;
        SemanticEnvelope envelope;
        QString callId;
        QString name;
        QString args;
    };

    QMap<int, PendingCall> m_slots;

    StreamFrame promote(int slot, PendingCall& call);
};
