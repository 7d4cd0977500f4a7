#include "stream_aggregator.h"
#include <algorithm>

// ---------------------------------------------------------------------------
// Convenience batch API
// ---------------------------------------------------------------------------

Result<SemanticResponse> StreamAggregator::aggregate(const QList<StreamFrame>& frames)
{
    reset();
    for (const StreamFrame& frame : frames) {
        addFrame(frame);
    }
    return finalize();
}

// ---------------------------------------------------------------------------
// Incremental frame ingestion
// ---------------------------------------------------------------------------

StreamAggregator::CandidateState& StreamAggregator::stateFor(int candidateIndex)
{
    if (!m_states.contains(candidateIndex)) {
        CandidateState state;
        state.candidate.index = candidateIndex;
        state.candidate.role = QStringLiteral("assistant");
        m_states[candidateIndex] = state;
    }
    return m_states[candidateIndex];
}

void StreamAggregator::addFrame(const StreamFrame& frame)
{
    switch (frame.type) {

    case FrameType::Started: {
        if (m_envelope.requestId.isEmpty()) {
            m_envelope = frame.envelope;
        }
        stateFor(frame.candidateIndex);
        if (!frame.responseId.isEmpty()) {
            m_responseId = frame.responseId;
        }
        if (!frame.model.isEmpty()) {
            m_modelUsed = frame.model;
        }
        applyUsage(m_totalUsage, frame.usageDelta);
        break;
    }

    case FrameType::Delta:
        applyDelta(stateFor(frame.candidateIndex), frame);
        break;

    case FrameType::ActionDelta:
        applyActionDelta(stateFor(frame.candidateIndex), frame.actionDelta);
        break;

    case FrameType::UsageDelta:
        applyUsage(m_totalUsage, frame.usageDelta);
        break;

    case FrameType::Finished: {
        CandidateState& state = stateFor(frame.candidateIndex);
        state.candidate.stopCause = frame.stopCause.value_or(StopCause::Completed);
        applyUsage(m_totalUsage, frame.usageDelta);
        break;
    }

    case FrameType::Failed: {
        m_hasFailed = true;
        m_lastFailure = frame.failure;
        break;
    }

    }  // end switch
}

// ---------------------------------------------------------------------------
// Finalize: build the SemanticResponse from accumulated state
// ---------------------------------------------------------------------------

Result<SemanticResponse> StreamAggregator::finalize()
{
    if (m_hasFailed) {
        DomainFailure failure = m_lastFailure;
        reset();
        return std::unexpected(failure);
    }

    SemanticResponse response;
    response.envelope = m_envelope;
    response.responseId = m_responseId;
    response.modelUsed = m_modelUsed;
    response.usage = m_totalUsage;
    if (response.usage.totalTokens == 0) {
        response.usage.totalTokens =
            response.usage.promptTokens + response.usage.completionTokens;
    }

    QList<int> indices = m_states.keys();
    std::sort(indices.begin(), indices.end());
    for (int idx : indices) {
        response.candidates.append(m_states[idx].candidate);
    }

    reset();
    return response;
}

void StreamAggregator::reset()
{
    m_states.clear();
    m_totalUsage = UsageEntry{};
    m_envelope = SemanticEnvelope{};
    m_responseId.clear();
    m_modelUsed.clear();
    m_lastFailure = DomainFailure{};
    m_hasFailed = false;
}

// ---------------------------------------------------------------------------
// Apply a Delta frame: merge adjacent text / reasoning, append the rest
// ---------------------------------------------------------------------------

void StreamAggregator::applyDelta(CandidateState& state, const StreamFrame& frame)
{
    Candidate& candidate = state.candidate;

    for (const Segment& deltaSeg : frame.deltaSegments) {
        const bool mergeable = deltaSeg.kind == SegmentKind::Text
                               || deltaSeg.kind == SegmentKind::Reasoning;
        if (mergeable && !candidate.output.isEmpty()
            && candidate.output.last().kind == deltaSeg.kind) {
            Segment& last = candidate.output.last();
            last.text.append(deltaSeg.text);
            for (auto it = deltaSeg.structured.constBegin();
                 it != deltaSeg.structured.constEnd(); ++it) {
                last.structured[it.key()] = it.value();
            }
            continue;
        }
        candidate.output.append(deltaSeg);
    }
}

// ---------------------------------------------------------------------------
// Apply an ActionDelta: accumulate tool call args by callId
// ---------------------------------------------------------------------------

void StreamAggregator::applyActionDelta(CandidateState& state,
                                         const ActionDelta& delta)
{
    if (delta.callId.isEmpty()) {
        return;
    }

    Candidate& candidate = state.candidate;

    if (state.actionByCallId.contains(delta.callId)) {
        int idx = state.actionByCallId[delta.callId];
        if (idx >= 0 && idx < candidate.toolCalls.size()) {
            ActionCall& existing = candidate.toolCalls[idx];
            existing.args.append(delta.argsPatch);
            if (existing.name.isEmpty() && !delta.name.isEmpty()) {
                existing.name = delta.name;
            }
        }
    } else {
        ActionCall call;
        call.callId = delta.callId;
        call.name = delta.name;
        call.args = delta.argsPatch;

        int newIndex = candidate.toolCalls.size();
        candidate.toolCalls.append(call);
        state.actionByCallId[delta.callId] = newIndex;
    }
}

// Usage frames carry cumulative counters; the largest value seen wins.
void StreamAggregator::applyUsage(UsageEntry& total, const UsageEntry& delta)
{
    total.promptTokens = qMax(total.promptTokens, delta.promptTokens);
    total.completionTokens = qMax(total.completionTokens, delta.completionTokens);
    total.totalTokens = qMax(total.totalTokens, delta.totalTokens);
}
