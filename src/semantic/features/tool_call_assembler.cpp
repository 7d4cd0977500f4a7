#include "tool_call_assembler.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonParseError>

bool ToolCallAssembler::isStructurallyComplete(const QString& args)
{
    if (args.trimmed().isEmpty()) {
        return false;
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(args.toUtf8(), &err);
    return err.error == QJsonParseError::NoError && (doc.isObject() || doc.isArray());
}

Result<QList<StreamFrame>> ToolCallAssembler::accept(const StreamFrame& fragment)
{
    QList<StreamFrame> out;
    const ActionDelta& delta = fragment.actionDelta;

    auto it = m_slots.find(delta.slot);
    if (it == m_slots.end()) {
        PendingCall call;
        call.candidateIndex = fragment.candidateIndex;
        call.envelope = fragment.envelope;
        it = m_slots.insert(delta.slot, call);
    }
    PendingCall& call = it.value();

    if (call.state == SlotState::Promoted) {
        if (delta.closed || delta.argsPatch.trimmed().isEmpty()) {
            return out;
        }
        return std::unexpected(DomainFailure::decodeFailed(
            QStringLiteral("tool_arguments_after_completion"),
            QStringLiteral("Tool call %1 received argument data after its arguments were complete")
                .arg(call.callId)));
    }

    if (!delta.callId.isEmpty()) {
        call.callId = delta.callId;
    }
    if (!delta.name.isEmpty()) {
        call.name = delta.name;
    }

    if (delta.closed) {
        // A closing marker may repeat the full arguments; the buffer wins
        // when fragments were already collected.
        if (call.args.isEmpty()) {
            call.args = delta.argsPatch;
        }
        out.append(promote(delta.slot, call));
        return out;
    }

    call.args.append(delta.argsPatch);
    if (!call.callId.isEmpty() && isStructurallyComplete(call.args)) {
        out.append(promote(delta.slot, call));
    }
    return out;
}

QList<StreamFrame> ToolCallAssembler::flush()
{
    QList<StreamFrame> out;
    for (auto it = m_slots.begin(); it != m_slots.end(); ++it) {
        if (it.value().state == SlotState::Collecting) {
            if (!it.value().args.isEmpty()
                && !isStructurallyComplete(it.value().args)) {
                LOG_WARNING(QStringLiteral("ToolCallAssembler: tool call %1 ended with incomplete arguments")
                                .arg(it.value().callId));
            }
            out.append(promote(it.key(), it.value()));
        }
    }
    return out;
}

void ToolCallAssembler::discard()
{
    m_slots.clear();
}

bool ToolCallAssembler::hasPending() const
{
    for (const PendingCall& call : m_slots) {
        if (call.state == SlotState::Collecting) {
            return true;
        }
    }
    return false;
}

StreamFrame ToolCallAssembler::promote(int slot, PendingCall& call)
{
    call.state = SlotState::Promoted;

    StreamFrame frame;
    frame.envelope = call.envelope;
    frame.type = FrameType::ActionDelta;
    frame.candidateIndex = call.candidateIndex;
    frame.actionDelta.slot = slot;
    frame.actionDelta.callId = call.callId;
    frame.actionDelta.name = call.name;
    // A call that never received arguments takes none, as in a buffered
    // response.
    frame.actionDelta.argsPatch = call.args.trimmed().isEmpty() ? QStringLiteral("{}") : call.args;
    frame.actionDelta.closed = true;
    return frame;
}
