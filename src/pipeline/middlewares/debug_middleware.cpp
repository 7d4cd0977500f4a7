#include "debug_middleware.h"
#include "core/log_manager.h"

namespace {
const char* frameTypeName(FrameType type) {
    switch (type) {
    case FrameType::Started:     return "started";
    case FrameType::Delta:       return "delta";
    case FrameType::ActionDelta: return "action_delta";
    case FrameType::UsageDelta:  return "usage";
    case FrameType::Finished:    return "finished";
    case FrameType::Failed:      return "failed";
    }
    return "unknown";
}
}

Result<SemanticRequest> DebugMiddleware::onRequest(SemanticRequest request) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Request: model=%1 messages=%2 tools=%3 stream=%4 %5 -> %6")
            .arg(request.model)
            .arg(request.messages.size())
            .arg(request.tools.size())
            .arg(request.stream ? "true" : "false")
            .arg(request.metadata.value(QStringLiteral("inbound.format")),
                 request.metadata.value(QStringLiteral("upstream.format"))));
    }
    return request;
}

Result<SemanticResponse> DebugMiddleware::onResponse(SemanticResponse response) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Response: model=%1 candidates=%2 tokens=%3")
            .arg(response.modelUsed)
            .arg(response.candidates.size())
            .arg(response.usage.totalTokens));
    }
    return response;
}

Result<StreamFrame> DebugMiddleware::onFrame(StreamFrame frame) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Frame: type=%1 model=%2 final=%3")
            .arg(QLatin1String(frameTypeName(frame.type)))
            .arg(frame.model)
            .arg(frame.isFinal));
    }
    return frame;
}
