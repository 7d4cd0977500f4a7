#include "stream_splitter.h"

StreamSplitter::StreamSplitter(int chunkSize)
    : m_chunkSize(chunkSize > 0 ? chunkSize : 20)
{
}

QList<StreamFrame> StreamSplitter::split(const SemanticResponse& response)
{
    QList<StreamFrame> frames;

    auto makeFrame = [&response](FrameType type, int candidateIndex) {
        StreamFrame frame;
        frame.envelope = response.envelope;
        frame.type = type;
        frame.candidateIndex = candidateIndex;
        return frame;
    };

    for (const Candidate& candidate : response.candidates) {
        const int ci = candidate.index;

        // ---------------------------------------------------------------
        // 1. Started carries the response-level metadata
        // ---------------------------------------------------------------
        StreamFrame started = makeFrame(FrameType::Started, ci);
        started.responseId = response.responseId;
        started.model = response.modelUsed;
        frames.append(started);

        // ---------------------------------------------------------------
        // 2. Content: text and reasoning are chunked, the rest goes whole
        // ---------------------------------------------------------------
        for (const Segment& segment : candidate.output) {
            const bool chunkable = (segment.kind == SegmentKind::Text
                                    || segment.kind == SegmentKind::Reasoning)
                                   && !segment.text.isEmpty();
            if (!chunkable) {
                StreamFrame delta = makeFrame(FrameType::Delta, ci);
                delta.deltaSegments.append(segment);
                frames.append(delta);
                continue;
            }

            const QString& text = segment.text;
            int pos = 0;
            while (pos < text.size()) {
                const int len = qMin(m_chunkSize, text.size() - pos);
                Segment piece = segment;
                piece.text = text.mid(pos, len);
                // Reasoning metadata (signature) travels with the last piece.
                if (pos + len < text.size()) {
                    piece.structured = QJsonObject();
                }

                StreamFrame delta = makeFrame(FrameType::Delta, ci);
                delta.deltaSegments.append(piece);
                frames.append(delta);
                pos += len;
            }
        }

        // ---------------------------------------------------------------
        // 3. Tool calls, already complete
        // ---------------------------------------------------------------
        int slot = 0;
        for (const ActionCall& call : candidate.toolCalls) {
            StreamFrame actionFrame = makeFrame(FrameType::ActionDelta, ci);
            actionFrame.actionDelta.slot = slot++;
            actionFrame.actionDelta.callId = call.callId;
            actionFrame.actionDelta.name = call.name;
            actionFrame.actionDelta.argsPatch = call.args;
            actionFrame.actionDelta.closed = true;
            frames.append(actionFrame);
        }

        // ---------------------------------------------------------------
        // 4. Usage once, on the first candidate
        // ---------------------------------------------------------------
        if (ci == response.candidates.first().index && !response.usage.isEmpty()) {
            StreamFrame usageFrame = makeFrame(FrameType::UsageDelta, ci);
            usageFrame.usageDelta = response.usage;
            frames.append(usageFrame);
        }

        // ---------------------------------------------------------------
        // 5. Finished
        // ---------------------------------------------------------------
        StreamFrame finished = makeFrame(FrameType::Finished, ci);
        finished.stopCause = candidate.stopCause;
        finished.isFinal = true;
        frames.append(finished);
    }

    if (response.candidates.isEmpty()) {
        if (!response.usage.isEmpty()) {
            StreamFrame usageFrame = makeFrame(FrameType::UsageDelta, 0);
            usageFrame.usageDelta = response.usage;
            frames.append(usageFrame);
        }

        StreamFrame finished = makeFrame(FrameType::Finished, 0);
        finished.stopCause = StopCause::Completed;
        finished.isFinal = true;
        frames.append(finished);
    }

    return frames;
}
